#pragma once

/** \file embedding_provider.hpp
 *  \brief Seam for text -> fixed-dimension vector models.
 *
 * Implementations must tolerate concurrent embed_batch() calls; the matcher embeds queries
 * from any reader thread once ready.
 */

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "ticketsim/error.hpp"

namespace ticketsim::embedding {

class embedding_provider {
public:
  virtual ~embedding_provider() = default;

  /** \brief Dimension of every vector this provider returns. */
  virtual auto dimension() const noexcept -> std::size_t = 0;

  /** \brief One vector per input text, in input order; provider_failed on any failure. */
  virtual auto embed_batch(std::span<const std::string> texts) const
      -> std::expected<std::vector<std::vector<float>>, core::error> = 0;
};

} // namespace ticketsim::embedding
