#include "ticketsim/config.hpp"

#include <optional>

#include "ticketsim/core/platform_utils.hpp"

namespace ticketsim {

namespace {

constexpr const char* kComponent = "config";

auto invalid(std::string message) -> std::unexpected<core::error> {
  return core::make_error(core::error_code::config_invalid, std::move(message), kComponent);
}

template <typename T>
auto overlay_number(const char* name, T& target) -> std::expected<void, core::error> {
  const auto raw = core::safe_getenv(name);
  if (!raw || raw->empty()) return {};
  const auto parsed = core::parse_number<T>(*raw);
  if (!parsed) {
    return invalid(std::string(name) + "='" + *raw + "' is not a valid number");
  }
  target = *parsed;
  return {};
}

void overlay_string(const char* name, std::string& target) {
  if (auto raw = core::safe_getenv(name); raw && !raw->empty()) target = *raw;
}

} // namespace

auto config_from_env(settings base) -> std::expected<settings, core::error> {
  auto& m = base.matcher;

  std::size_t dim = m.dimension;
  if (auto r = overlay_number("TICKETSIM_DIM", dim); !r) return std::unexpected(r.error());
  m.dimension = dim;
  if (core::safe_getenv("TICKETSIM_DIM")) base.embedding.dimension = dim;

  if (auto r = overlay_number("TICKETSIM_M", m.hnsw.M); !r) return std::unexpected(r.error());
  if (auto r = overlay_number("TICKETSIM_EF_CONSTRUCTION", m.hnsw.efConstruction); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = overlay_number("TICKETSIM_EF_SEARCH", m.ef_search); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = overlay_number("TICKETSIM_THRESHOLD", m.similarity_threshold); !r) {
    return std::unexpected(r.error());
  }
  if (auto r = overlay_number("TICKETSIM_TOP_K", m.default_k); !r) {
    return std::unexpected(r.error());
  }

  overlay_string("TICKETSIM_INDEX_PATH", m.index_path);
  overlay_string("TICKETSIM_CORPUS_PATH", m.corpus_path);
  overlay_string("TICKETSIM_EMBED_ENDPOINT", base.embedding.endpoint);
  overlay_string("TICKETSIM_EMBED_MODEL", base.embedding.model);
  overlay_string("TICKETSIM_CHAT_ENDPOINT", base.chat.endpoint);
  overlay_string("TICKETSIM_CHAT_MODEL", base.chat.model);

  if (auto r = validate(m); !r) return std::unexpected(r.error());
  return base;
}

auto validate(const matcher_config& config) -> std::expected<void, core::error> {
  if (config.dimension == 0) return invalid("dimension must be > 0");
  if (config.hnsw.M < 2) return invalid("M must be >= 2");
  if (config.hnsw.efConstruction < config.hnsw.M) return invalid("ef_construction must be >= M");
  if (config.ef_search == 0) return invalid("ef_search must be > 0");
  if (config.default_k == 0) return invalid("default_k must be > 0");
  if (config.embed_batch_size == 0) return invalid("embed_batch_size must be > 0");
  if (!(config.similarity_threshold >= -1.0f && config.similarity_threshold <= 1.0f)) {
    return invalid("similarity_threshold must be within [-1, 1]");
  }
  return {};
}

} // namespace ticketsim
