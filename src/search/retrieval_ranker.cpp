#include "ticketsim/search/retrieval_ranker.hpp"

#include <algorithm>
#include <string>

namespace ticketsim::search {

auto rank(std::span<const index::HnswHit> raw, const slot_resolver& resolve, float threshold)
    -> std::expected<std::vector<match_result>, core::error> {
  std::vector<match_result> out;
  out.reserve(raw.size());

  for (const auto& hit : raw) {
    const float similarity = 1.0f - hit.distance;
    if (similarity < threshold) continue;

    const ticket_record* rec = resolve ? resolve(hit.slot) : nullptr;
    if (rec == nullptr) {
      return core::make_error(core::error_code::not_found,
                              "No ticket record for slot " + std::to_string(hit.slot),
                              "search.ranker");
    }
    out.push_back(match_result{rec->id, similarity, rec->issue, rec->category,
                               rec->description, rec->resolved, rec->resolution});
  }

  std::stable_sort(out.begin(), out.end(), [](const match_result& a, const match_result& b) {
    if (a.resolved != b.resolved) return a.resolved;
    return a.similarity > b.similarity;
  });
  return out;
}

auto rank(std::span<const index::HnswHit> raw, std::span<const ticket_record> records,
          float threshold) -> std::expected<std::vector<match_result>, core::error> {
  return rank(
      raw,
      [records](index::slot_id slot) -> const ticket_record* {
        return slot < records.size() ? &records[slot] : nullptr;
      },
      threshold);
}

} // namespace ticketsim::search
