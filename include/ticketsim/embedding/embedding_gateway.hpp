#pragma once

/**
 * \file embedding_gateway.hpp
 * \brief Validating front end over an embedding_provider.
 *
 * - embed_batch() splits inputs into chunks of batch_size before calling the provider
 * - every returned vector is checked for count, dimension and finiteness
 * - any provider or validation failure surfaces as provider_failed; nothing is retried
 *
 * Thread-safety: const and stateless after construction; safe for concurrent callers when
 * the provider is.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "ticketsim/embedding/embedding_provider.hpp"
#include "ticketsim/error.hpp"

namespace ticketsim::embedding {

class embedding_gateway {
public:
  static constexpr std::size_t kDefaultBatchSize = 32;

  /** \brief invalid_argument for a null provider, zero dimension or batch size, or a
   *         provider whose dimension() differs from dimension.
   */
  static auto create(std::shared_ptr<const embedding_provider> provider, std::size_t dimension,
                     std::size_t batch_size = kDefaultBatchSize)
      -> std::expected<embedding_gateway, core::error>;

  auto embed(const std::string& text) const -> std::expected<std::vector<float>, core::error>;

  auto embed_batch(std::span<const std::string> texts) const
      -> std::expected<std::vector<std::vector<float>>, core::error>;

  auto dimension() const noexcept -> std::size_t { return dimension_; }
  auto batch_size() const noexcept -> std::size_t { return batch_size_; }

private:
  embedding_gateway(std::shared_ptr<const embedding_provider> provider, std::size_t dimension,
                    std::size_t batch_size)
      : provider_(std::move(provider)), dimension_(dimension), batch_size_(batch_size) {}

  auto embed_chunk(std::span<const std::string> texts) const
      -> std::expected<std::vector<std::vector<float>>, core::error>;

  std::shared_ptr<const embedding_provider> provider_;
  std::size_t dimension_;
  std::size_t batch_size_;
};

} // namespace ticketsim::embedding
