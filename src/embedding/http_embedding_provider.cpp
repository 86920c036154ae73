#include "ticketsim/embedding/http_embedding_provider.hpp"

#include <nlohmann/json.hpp>

#include "ticketsim/net/http_client.hpp"

namespace ticketsim::embedding {

namespace {

constexpr const char* kComponent = "embedding.http";

auto malformed(std::string detail) -> std::unexpected<core::error> {
  return core::make_error(core::error_code::provider_failed,
                          "Malformed embedding response: " + std::move(detail), kComponent);
}

} // namespace

auto http_embedding_provider::make_request_body(std::string_view model,
                                                std::span<const std::string> texts)
    -> std::string {
  nlohmann::json j;
  j["model"] = std::string(model);
  j["input"] = nlohmann::json::array();
  for (const auto& t : texts) j["input"].push_back(t);
  // Invalid UTF-8 in ticket text is replaced, never thrown.
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto http_embedding_provider::parse_response_body(std::string_view body)
    -> std::expected<std::vector<std::vector<float>>, core::error> {
  const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) return malformed("not JSON");
  if (!j.is_object() || !j.contains("embeddings") || !j["embeddings"].is_array()) {
    return malformed("missing 'embeddings' array");
  }

  std::vector<std::vector<float>> out;
  out.reserve(j["embeddings"].size());
  for (const auto& row : j["embeddings"]) {
    if (!row.is_array()) return malformed("embedding is not an array");
    std::vector<float> v;
    v.reserve(row.size());
    for (const auto& x : row) {
      if (!x.is_number()) return malformed("non-numeric embedding value");
      v.push_back(x.get<float>());
    }
    out.push_back(std::move(v));
  }
  return out;
}

auto http_embedding_provider::embed_batch(std::span<const std::string> texts) const
    -> std::expected<std::vector<std::vector<float>>, core::error> {
  if (texts.empty()) return std::vector<std::vector<float>>{};

  net::post_options opts;
  opts.timeout = config_.timeout;
  auto resp = net::post_json(config_.endpoint, make_request_body(config_.model, texts), opts);
  if (!resp) return std::unexpected(resp.error());
  if (!net::is_success(resp->status)) {
    return core::make_error(core::error_code::provider_failed,
                            "Embedding endpoint returned HTTP " + std::to_string(resp->status),
                            kComponent);
  }
  return parse_response_body(resp->body);
}

} // namespace ticketsim::embedding
