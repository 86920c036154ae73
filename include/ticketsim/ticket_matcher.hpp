#pragma once

/**
 * \file ticket_matcher.hpp
 * \brief Public entry point: find previously recorded tickets similar to a new one.
 *
 * Lifecycle (one transition to ready per instance, never back):
 *   uninitialized --build_from_corpus()--> ready
 *   uninitialized --load()--> index_loaded --attach_corpus()--> ready
 * building marks a build or load in progress. A failed build or load returns to
 * uninitialized; a failed attach stays in index_loaded.
 *
 * Thread-safety: lifecycle calls are single-writer; a concurrent or repeated one fails with
 * precondition_failed. Once ready, nothing mutates the index or corpus and find_similar()
 * is safe for any number of concurrent callers.
 */

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "ticketsim/config.hpp"
#include "ticketsim/corpus/slot_table.hpp"
#include "ticketsim/embedding/embedding_gateway.hpp"
#include "ticketsim/embedding/embedding_provider.hpp"
#include "ticketsim/error.hpp"
#include "ticketsim/index/hnsw.hpp"
#include "ticketsim/search/retrieval_ranker.hpp"
#include "ticketsim/ticket.hpp"

namespace ticketsim {

enum class matcher_state : std::uint8_t { uninitialized, building, index_loaded, ready };

constexpr std::string_view to_string(matcher_state s) noexcept {
  switch (s) {
    case matcher_state::uninitialized: return "uninitialized";
    case matcher_state::building: return "building";
    case matcher_state::index_loaded: return "index_loaded";
    case matcher_state::ready: return "ready";
  }
  return "unknown";
}

class ticket_matcher {
public:
  /** \brief Validated, uninitialized matcher.
   * \return config_invalid for out-of-range config; invalid_argument for a null provider or
   *         one whose dimension differs from config.dimension
   */
  static auto create(matcher_config config,
                     std::shared_ptr<const embedding::embedding_provider> provider)
      -> std::expected<std::unique_ptr<ticket_matcher>, core::error>;

  /** \brief Ready matcher over config.corpus_path.
   *
   * Loads config.index_path (and its slot table) when that file exists, otherwise builds
   * from the corpus and persists to config.index_path if one is set. A configured
   * index_path that does not exist yet is not an error: it is created by the build.
   * The slot table is written before the index, and a failed save removes both, so an
   * index file found here always has its slot table.
   * \return config_invalid without a corpus path; io_failed when the corpus is missing;
   *         any error of create(), build_from_corpus(), load() or attach_corpus()
   */
  static auto open(matcher_config config,
                   std::shared_ptr<const embedding::embedding_provider> provider)
      -> std::expected<std::unique_ptr<ticket_matcher>, core::error>;

  ticket_matcher(const ticket_matcher&) = delete;
  ticket_matcher& operator=(const ticket_matcher&) = delete;

  /** \brief Embed and index records (slot i = records[i]); persist when index_path is set.
   *
   * Errors: precondition_failed unless uninitialized; invalid_argument for an empty corpus
   * or duplicate ticket ids (nothing is written); provider_failed from embedding;
   * io_failed when persisting fails.
   */
  auto build_from_corpus(std::vector<ticket_record> records) -> std::expected<void, core::error>;

  /** \brief Load a persisted index and its slot table; state becomes index_loaded.
   *
   * Errors: precondition_failed unless uninitialized; io_failed / data_integrity from the
   * index or slot table, including a dimension or element-count mismatch.
   */
  auto load(const std::string& index_path) -> std::expected<void, core::error>;

  /** \brief Bind the record table to a loaded index; state becomes ready.
   *
   * The records must carry exactly the persisted ticket ids in slot order, otherwise
   * data_integrity. precondition_failed unless index_loaded.
   */
  auto attach_corpus(std::vector<ticket_record> records) -> std::expected<void, core::error>;

  /** \brief Ranked matches for a new ticket.
   *
   * Errors: not_initialized unless ready; invalid_argument for k == 0; provider_failed
   * when the query cannot be embedded; not_found when a hit has no record.
   */
  auto find_similar(const std::optional<std::string>& issue,
                    const std::optional<std::string>& category,
                    const std::optional<std::string>& description, std::size_t k = 3,
                    float threshold = search::kDefaultSimilarityThreshold) const
      -> std::expected<std::vector<match_result>, core::error>;

  auto find_similar(const ticket_query& query, std::size_t k, float threshold) const
      -> std::expected<std::vector<match_result>, core::error>;

  /** \brief find_similar() with config.default_k and config.similarity_threshold. */
  auto find_similar(const ticket_query& query) const
      -> std::expected<std::vector<match_result>, core::error>;

  auto state() const noexcept -> matcher_state { return state_.load(std::memory_order_acquire); }
  auto size() const noexcept -> std::size_t;
  auto config() const noexcept -> const matcher_config& { return config_; }

  /** \brief Read-only view of the attached records (empty until ready). */
  auto records() const noexcept -> std::span<const ticket_record>;

private:
  ticket_matcher(matcher_config config, embedding::embedding_gateway gateway)
      : config_(std::move(config)), gateway_(std::move(gateway)) {}

  auto begin_transition(matcher_state from) -> std::expected<void, core::error>;
  auto persist(const std::string& index_path) const -> std::expected<void, core::error>;

  matcher_config config_;
  embedding::embedding_gateway gateway_;
  index::HnswIndex index_;
  corpus::slot_table slots_;
  std::vector<ticket_record> records_;
  std::atomic<matcher_state> state_{matcher_state::uninitialized};
};

} // namespace ticketsim
