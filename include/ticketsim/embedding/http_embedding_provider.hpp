#pragma once

/** \file http_embedding_provider.hpp
 *  \brief embedding_provider backed by an Ollama-style /api/embed endpoint.
 *
 * Request:  {"model": "<model>", "input": ["text", ...]}
 * Response: {"embeddings": [[f, ...], ...]}
 */

#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ticketsim/config.hpp"
#include "ticketsim/embedding/embedding_provider.hpp"

namespace ticketsim::embedding {

class http_embedding_provider final : public embedding_provider {
public:
  explicit http_embedding_provider(http_embedding_config config) : config_(std::move(config)) {}

  auto dimension() const noexcept -> std::size_t override { return config_.dimension; }

  auto embed_batch(std::span<const std::string> texts) const
      -> std::expected<std::vector<std::vector<float>>, core::error> override;

  /** \brief Serialize the request body. */
  static auto make_request_body(std::string_view model, std::span<const std::string> texts)
      -> std::string;

  /** \brief Extract "embeddings" from a response body; provider_failed when malformed. */
  static auto parse_response_body(std::string_view body)
      -> std::expected<std::vector<std::vector<float>>, core::error>;

private:
  http_embedding_config config_;
};

} // namespace ticketsim::embedding
