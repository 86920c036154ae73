#pragma once

/**
 * \file config.hpp
 * \brief Runtime configuration for the matcher and its HTTP adapters.
 *
 * All structs carry in-class defaults for a MiniLM deployment
 * (all-MiniLM-L6-v2 embeddings, hnswlib-style M=16 / ef_construction=200 / ef=50).
 * config_from_env() overlays TICKETSIM_* environment variables on a base value.
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

#include "ticketsim/error.hpp"
#include "ticketsim/index/hnsw.hpp"

namespace ticketsim {

using hnsw_build_params = index::HnswBuildParams;

/** \brief Parameters owned by ticket_matcher. */
struct matcher_config {
  std::size_t dimension{384};             /**< embedding dimension */
  hnsw_build_params hnsw{};               /**< M, efConstruction, seed */
  std::uint32_t ef_search{50};            /**< query beam width */
  std::size_t default_k{3};
  float similarity_threshold{0.5f};
  std::size_t embed_batch_size{32};
  std::string index_path;                 /**< empty: never persist */
  std::string corpus_path;                /**< CSV used by ticket_matcher::open() */
};

/** \brief Ollama-style /api/embed endpoint. */
struct http_embedding_config {
  std::string endpoint{"http://127.0.0.1:11434/api/embed"};
  std::string model{"all-minilm"};
  std::size_t dimension{384};
  std::chrono::milliseconds timeout{30000};
};

/** \brief OpenAI-compatible chat completions endpoint. */
struct chat_config {
  std::string endpoint{"https://api-inference.huggingface.co/v1/chat/completions"};
  std::string model{"mistralai/Mixtral-8x7B-Instruct-v0.1"};
  std::string api_key_env{"HUGGINGFACE_API_KEY"};   /**< variable holding the bearer token */
  std::chrono::milliseconds timeout{60000};
};

struct settings {
  matcher_config matcher;
  http_embedding_config embedding;
  chat_config chat;
};

/** \brief Overlay TICKETSIM_* variables on base.
 *
 * Recognised: TICKETSIM_DIM, TICKETSIM_M, TICKETSIM_EF_CONSTRUCTION, TICKETSIM_EF_SEARCH,
 * TICKETSIM_THRESHOLD, TICKETSIM_TOP_K, TICKETSIM_INDEX_PATH, TICKETSIM_CORPUS_PATH,
 * TICKETSIM_EMBED_ENDPOINT, TICKETSIM_EMBED_MODEL, TICKETSIM_CHAT_ENDPOINT,
 * TICKETSIM_CHAT_MODEL. TICKETSIM_DIM sets both the matcher and embedding dimension.
 * A malformed number is config_invalid. The result is validated.
 */
auto config_from_env(settings base = {}) -> std::expected<settings, core::error>;

/** \brief Range checks; config_invalid naming the first offending field. */
auto validate(const matcher_config& config) -> std::expected<void, core::error>;

} // namespace ticketsim
