#pragma once

/** \file retrieval_ranker.hpp
 *  \brief Turns raw ANN hits into ordered ticket matches.
 *
 * Policy, applied in order:
 * 1. similarity = 1 - distance
 * 2. hard filter: drop hits with similarity < threshold
 * 3. resolve each slot to its record; an unmapped slot fails the whole call (not_found)
 * 4. stable sort by resolved (true first), then similarity descending; ANN order breaks
 *    remaining ties
 */

#include <expected>
#include <functional>
#include <span>
#include <vector>

#include "ticketsim/error.hpp"
#include "ticketsim/index/hnsw.hpp"
#include "ticketsim/ticket.hpp"

namespace ticketsim::search {

/** \brief Slot to record lookup; returns nullptr when the slot has no record. */
using slot_resolver = std::function<const ticket_record*(index::slot_id)>;

inline constexpr float kDefaultSimilarityThreshold = 0.5f;

/** \brief Rank ANN hits.
 *
 * \param raw Hits in ANN order (ascending distance)
 * \param resolve Slot to record mapping
 * \param threshold Minimum similarity kept (inclusive)
 * \return Ordered matches, possibly empty; not_found on an unmapped slot
 */
auto rank(std::span<const index::HnswHit> raw, const slot_resolver& resolve,
          float threshold = kDefaultSimilarityThreshold)
    -> std::expected<std::vector<match_result>, core::error>;

/** \brief Convenience overload resolving slots against a slot-ordered record table. */
auto rank(std::span<const index::HnswHit> raw, std::span<const ticket_record> records,
          float threshold = kDefaultSimilarityThreshold)
    -> std::expected<std::vector<match_result>, core::error>;

} // namespace ticketsim::search
