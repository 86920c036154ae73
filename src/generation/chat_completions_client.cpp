#include "ticketsim/generation/chat_completions_client.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "ticketsim/core/platform_utils.hpp"
#include "ticketsim/net/http_client.hpp"

namespace ticketsim::generation {

namespace {

constexpr const char* kComponent = "generation.chat";

} // namespace

auto chat_completions_client::create(chat_config config)
    -> std::expected<std::unique_ptr<chat_completions_client>, core::error> {
  auto key = core::safe_getenv(config.api_key_env.c_str());
  if (!key || key->empty()) {
    return core::make_error(core::error_code::config_invalid,
                            "Environment variable " + config.api_key_env + " is not set",
                            kComponent);
  }
  return std::make_unique<chat_completions_client>(std::move(config), std::move(*key));
}

auto chat_completions_client::make_request_body(std::string_view model,
                                                const chat_request& request) -> std::string {
  nlohmann::json j;
  j["model"] = std::string(model);
  j["messages"] = nlohmann::json::array();
  for (const auto& m : request.messages) {
    j["messages"].push_back({{"role", m.role}, {"content", m.content}});
  }
  j["max_tokens"] = request.sampling.max_tokens;
  j["temperature"] = request.sampling.temperature;
  j["top_p"] = request.sampling.top_p;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto chat_completions_client::parse_response_body(std::string_view body)
    -> std::expected<std::string, core::error> {
  const auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded()) {
    return core::make_error(core::error_code::provider_failed,
                            "Chat response is not JSON", kComponent);
  }
  try {
    return j.at("choices").at(0).at("message").at("content").get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    return core::make_error(core::error_code::provider_failed,
                            std::string("Malformed chat response: ") + e.what(), kComponent);
  }
}

auto chat_completions_client::complete(const chat_request& request) const
    -> std::expected<std::string, core::error> {
  net::post_options opts;
  opts.timeout = config_.timeout;
  opts.headers.push_back("Authorization: Bearer " + api_key_);

  auto resp = net::post_json(config_.endpoint, make_request_body(config_.model, request), opts);
  if (!resp) return std::unexpected(resp.error());
  if (!net::is_success(resp->status)) {
    spdlog::error("[{}] {} returned HTTP {}", kComponent, config_.endpoint, resp->status);
    return core::make_error(core::error_code::provider_failed,
                            "Chat endpoint returned HTTP " + std::to_string(resp->status),
                            kComponent);
  }
  return parse_response_body(resp->body);
}

} // namespace ticketsim::generation
