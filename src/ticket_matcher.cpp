#include "ticketsim/ticket_matcher.hpp"

#include <filesystem>
#include <system_error>
#include <unordered_set>

#include <spdlog/spdlog.h>

#include "ticketsim/corpus/ticket_corpus.hpp"
#include "ticketsim/text/normalizer.hpp"

namespace ticketsim {

namespace {

constexpr const char* kComponent = "matcher";

/** \brief Restores a state on scope exit unless committed. */
class state_guard {
public:
  state_guard(std::atomic<matcher_state>& state, matcher_state on_failure) noexcept
      : state_(state), on_failure_(on_failure) {}
  ~state_guard() {
    if (!committed_) state_.store(on_failure_, std::memory_order_release);
  }
  state_guard(const state_guard&) = delete;
  state_guard& operator=(const state_guard&) = delete;

  void commit(matcher_state next) noexcept {
    state_.store(next, std::memory_order_release);
    committed_ = true;
  }

private:
  std::atomic<matcher_state>& state_;
  matcher_state on_failure_;
  bool committed_{false};
};

auto log_failure(std::string_view op, const core::error& e) -> std::unexpected<core::error> {
  spdlog::error("[{}] {} failed ({}): {}", kComponent, op, core::to_string(e.code), e.message);
  return std::unexpected(e);
}

} // namespace

auto ticket_matcher::create(matcher_config config,
                            std::shared_ptr<const embedding::embedding_provider> provider)
    -> std::expected<std::unique_ptr<ticket_matcher>, core::error> {
  if (auto ok = validate(config); !ok) return std::unexpected(ok.error());

  auto gateway = embedding::embedding_gateway::create(std::move(provider), config.dimension,
                                                      config.embed_batch_size);
  if (!gateway) return std::unexpected(gateway.error());

  return std::unique_ptr<ticket_matcher>(
      new ticket_matcher(std::move(config), std::move(*gateway)));
}

auto ticket_matcher::open(matcher_config config,
                          std::shared_ptr<const embedding::embedding_provider> provider)
    -> std::expected<std::unique_ptr<ticket_matcher>, core::error> {
  if (config.corpus_path.empty()) {
    return core::make_error(core::error_code::config_invalid,
                            "A ticket corpus path is required", kComponent);
  }
  auto matcher = create(config, std::move(provider));
  if (!matcher) return std::unexpected(matcher.error());

  auto corpus = corpus::ticket_corpus::load_csv(config.corpus_path);
  if (!corpus) return log_failure("open", corpus.error());
  std::vector<ticket_record> records(corpus->records().begin(), corpus->records().end());

  std::error_code ec;
  if (!config.index_path.empty() && std::filesystem::exists(config.index_path, ec)) {
    if (auto r = (*matcher)->load(config.index_path); !r) return std::unexpected(r.error());
    if (auto r = (*matcher)->attach_corpus(std::move(records)); !r) {
      return std::unexpected(r.error());
    }
  } else {
    if (auto r = (*matcher)->build_from_corpus(std::move(records)); !r) {
      return std::unexpected(r.error());
    }
  }
  return matcher;
}

auto ticket_matcher::begin_transition(matcher_state from) -> std::expected<void, core::error> {
  matcher_state expected = from;
  if (state_.compare_exchange_strong(expected, matcher_state::building,
                                     std::memory_order_acq_rel, std::memory_order_acquire)) {
    return {};
  }
  return core::make_error(core::error_code::precondition_failed,
                          "Matcher is " + std::string(to_string(expected)) + ", expected " +
                              std::string(to_string(from)),
                          kComponent);
}

auto ticket_matcher::build_from_corpus(std::vector<ticket_record> records)
    -> std::expected<void, core::error> {
  if (auto r = begin_transition(matcher_state::uninitialized); !r) return r;
  state_guard guard(state_, matcher_state::uninitialized);

  if (records.empty()) {
    return log_failure("build", core::error{core::error_code::invalid_argument,
                                            "Cannot build from an empty corpus", kComponent});
  }
  std::unordered_set<std::string_view> seen;
  seen.reserve(records.size());
  for (const auto& rec : records) {
    if (!seen.insert(rec.id).second) {
      return log_failure("build", core::error{core::error_code::invalid_argument,
                                              "Duplicate ticket id '" + rec.id + "'",
                                              kComponent});
    }
  }

  spdlog::info("[{}] building index over {} tickets (dim={}, M={}, ef_construction={})",
               kComponent, records.size(), config_.dimension, config_.hnsw.M,
               config_.hnsw.efConstruction);

  std::vector<std::string> texts;
  texts.reserve(records.size());
  for (const auto& rec : records) texts.push_back(text::normalize(rec));

  auto vectors = gateway_.embed_batch(texts);
  if (!vectors) return log_failure("build", vectors.error());

  auto built = index::HnswIndex::build(config_.dimension, *vectors, config_.hnsw);
  if (!built) return log_failure("build", built.error());
  if (auto r = built->set_query_quality(config_.ef_search); !r) {
    return log_failure("build", r.error());
  }

  index_ = std::move(*built);
  slots_ = corpus::slot_table::from_records(records);
  records_ = std::move(records);

  if (!config_.index_path.empty()) {
    if (auto r = persist(config_.index_path); !r) {
      index_ = index::HnswIndex{};
      slots_ = corpus::slot_table{};
      records_.clear();
      return log_failure("build", r.error());
    }
  }

  guard.commit(matcher_state::ready);
  spdlog::info("[{}] ready with {} tickets", kComponent, records_.size());
  return {};
}

auto ticket_matcher::persist(const std::string& index_path) const
    -> std::expected<void, core::error> {
  // Slot table first: an index file on disk always has its slot table beside it.
  const auto slots_path = corpus::slot_table_path(index_path);
  auto saved = slots_.save(slots_path);
  if (saved) saved = index_.save(index_path);
  if (!saved) {
    for (const std::filesystem::path& p : {slots_path, std::filesystem::path(index_path)}) {
      std::error_code ec;
      std::filesystem::remove(p, ec);
      if (ec) spdlog::warn("[{}] could not remove {}: {}", kComponent, p.string(), ec.message());
    }
    return saved;
  }
  spdlog::info("[{}] saved index to {} and slot table to {}", kComponent, index_path,
               slots_path.string());
  return {};
}

auto ticket_matcher::load(const std::string& index_path) -> std::expected<void, core::error> {
  if (auto r = begin_transition(matcher_state::uninitialized); !r) return r;
  state_guard guard(state_, matcher_state::uninitialized);

  auto loaded = index::HnswIndex::load(index_path, config_.dimension);
  if (!loaded) return log_failure("load", loaded.error());

  auto table = corpus::slot_table::load(corpus::slot_table_path(index_path));
  if (!table) return log_failure("load", table.error());

  if (table->size() != loaded->size()) {
    return log_failure("load", core::error{core::error_code::data_integrity,
                                           "Index holds " + std::to_string(loaded->size()) +
                                               " vectors but slot table has " +
                                               std::to_string(table->size()) + " ids",
                                           kComponent});
  }
  if (auto r = loaded->set_query_quality(config_.ef_search); !r) {
    return log_failure("load", r.error());
  }

  index_ = std::move(*loaded);
  slots_ = std::move(*table);
  guard.commit(matcher_state::index_loaded);
  spdlog::info("[{}] loaded index {} ({} vectors)", kComponent, index_path, index_.size());
  return {};
}

auto ticket_matcher::attach_corpus(std::vector<ticket_record> records)
    -> std::expected<void, core::error> {
  if (auto r = begin_transition(matcher_state::index_loaded); !r) return r;
  state_guard guard(state_, matcher_state::index_loaded);

  if (auto r = slots_.verify_against(records); !r) return log_failure("attach", r.error());

  records_ = std::move(records);
  guard.commit(matcher_state::ready);
  spdlog::info("[{}] ready with {} tickets", kComponent, records_.size());
  return {};
}

auto ticket_matcher::find_similar(const std::optional<std::string>& issue,
                                  const std::optional<std::string>& category,
                                  const std::optional<std::string>& description, std::size_t k,
                                  float threshold) const
    -> std::expected<std::vector<match_result>, core::error> {
  return find_similar(ticket_query{issue, category, description}, k, threshold);
}

auto ticket_matcher::find_similar(const ticket_query& query) const
    -> std::expected<std::vector<match_result>, core::error> {
  return find_similar(query, config_.default_k, config_.similarity_threshold);
}

auto ticket_matcher::find_similar(const ticket_query& query, std::size_t k, float threshold) const
    -> std::expected<std::vector<match_result>, core::error> {
  if (state() != matcher_state::ready) {
    return core::make_error(core::error_code::not_initialized,
                            "Matcher is not ready; build or load an index first", kComponent);
  }
  if (k == 0) {
    return core::make_error(core::error_code::invalid_argument, "k must be > 0", kComponent);
  }

  const std::string text = text::normalize(query.issue, query.category, query.description);
  auto vec = gateway_.embed(text);
  if (!vec) return std::unexpected(vec.error());

  auto hits = index_.search(*vec, k);
  if (!hits) return std::unexpected(hits.error());

  auto ranked = search::rank(*hits, std::span<const ticket_record>(records_), threshold);
  if (ranked) {
    spdlog::debug("[{}] query '{}': {} hits, {} above threshold {}", kComponent, text,
                  hits->size(), ranked->size(), threshold);
  }
  return ranked;
}

auto ticket_matcher::size() const noexcept -> std::size_t {
  return state() == matcher_state::ready ? records_.size() : 0;
}

auto ticket_matcher::records() const noexcept -> std::span<const ticket_record> {
  if (state() != matcher_state::ready) return {};
  return records_;
}

} // namespace ticketsim
