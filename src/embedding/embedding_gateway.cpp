#include "ticketsim/embedding/embedding_gateway.hpp"

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

namespace ticketsim::embedding {

namespace {

constexpr const char* kComponent = "embedding.gateway";

auto provider_error(std::string message) -> std::unexpected<core::error> {
  return core::make_error(core::error_code::provider_failed, std::move(message), kComponent);
}

} // namespace

auto embedding_gateway::create(std::shared_ptr<const embedding_provider> provider,
                               std::size_t dimension, std::size_t batch_size)
    -> std::expected<embedding_gateway, core::error> {
  using core::error_code;
  if (!provider) {
    return core::make_error(error_code::invalid_argument, "Embedding provider is null", kComponent);
  }
  if (dimension == 0 || batch_size == 0) {
    return core::make_error(error_code::invalid_argument,
                            "Dimension and batch size must be > 0", kComponent);
  }
  if (provider->dimension() != dimension) {
    return core::make_error(error_code::invalid_argument,
                            "Provider dimension " + std::to_string(provider->dimension()) +
                                " does not match configured dimension " +
                                std::to_string(dimension),
                            kComponent);
  }
  return embedding_gateway(std::move(provider), dimension, batch_size);
}

auto embedding_gateway::embed(const std::string& text) const
    -> std::expected<std::vector<float>, core::error> {
  auto vecs = embed_chunk(std::span<const std::string>(&text, 1));
  if (!vecs) return std::unexpected(vecs.error());
  return std::move(vecs->front());
}

auto embedding_gateway::embed_batch(std::span<const std::string> texts) const
    -> std::expected<std::vector<std::vector<float>>, core::error> {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (std::size_t off = 0; off < texts.size(); off += batch_size_) {
    const std::size_t n = std::min(batch_size_, texts.size() - off);
    auto chunk = embed_chunk(texts.subspan(off, n));
    if (!chunk) return std::unexpected(chunk.error());
    for (auto& v : *chunk) out.push_back(std::move(v));
    spdlog::debug("[{}] embedded {}/{} texts", kComponent, off + n, texts.size());
  }
  return out;
}

auto embedding_gateway::embed_chunk(std::span<const std::string> texts) const
    -> std::expected<std::vector<std::vector<float>>, core::error> {
  auto result = provider_->embed_batch(texts);
  if (!result) {
    const auto& err = result.error();
    return provider_error("Embedding provider failed [" + std::string(core::to_string(err.code)) +
                          "]: " + err.message);
  }
  if (result->size() != texts.size()) {
    return provider_error("Provider returned " + std::to_string(result->size()) +
                          " vectors for " + std::to_string(texts.size()) + " texts");
  }
  for (std::size_t i = 0; i < result->size(); ++i) {
    const auto& v = (*result)[i];
    if (v.size() != dimension_) {
      return provider_error("Provider returned a vector of dimension " +
                            std::to_string(v.size()) + ", expected " +
                            std::to_string(dimension_));
    }
    if (!std::all_of(v.begin(), v.end(), [](float x) { return std::isfinite(x); })) {
      return provider_error("Provider returned a non-finite value in vector " +
                            std::to_string(i));
    }
  }
  return result;
}

} // namespace ticketsim::embedding
