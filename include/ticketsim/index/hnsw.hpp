#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World (HNSW) index over cosine distance.
 *
 * Features:
 * - Multi-layer proximity graph with hierarchical structure
 * - Greedy descent plus beam expansion (ef) on the base layer
 * - Dense slot ids: the i-th vector given to build() is slot i
 * - Versioned, checksummed persistence
 *
 * Vectors are scaled to unit length on the way in, so distance is 1 - dot(a, b) and a
 * zero vector sits at distance 1 from everything.
 *
 * Thread-safety: build() and load() produce a finished graph; the graph is never mutated
 * afterwards, so search() is safe for concurrent callers. set_query_quality() is an atomic
 * store and may race with searches.
 * Memory: O(M * N) edges where M is max connections per node.
 */

#include <atomic>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "ticketsim/error.hpp"

namespace ticketsim::index {

/** \brief Dense position of a vector inside the index, assigned in insertion order. */
using slot_id = std::uint32_t;

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{16};                    /**< Max connections per node on upper layers */
    std::uint32_t efConstruction{200};      /**< Beam width during construction */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    bool keep_pruned_connections{true};     /**< Refill pruned slots up to M (Algorithm 4) */
};

/** \brief HNSW index statistics. */
struct HnswStats {
    std::size_t n_nodes{0};                 /**< Total nodes in graph */
    std::size_t n_edges{0};                 /**< Directed edges on the base layer */
    std::size_t n_levels{0};                /**< Number of hierarchy levels */
    std::size_t memory_bytes{0};            /**< Approximate heap usage */
    float avg_degree{0.0f};                 /**< Average base-layer out-degree */
    std::vector<std::size_t> level_counts;  /**< Nodes whose top level is i */
};

/** \brief One neighbor returned by search(). */
struct HnswHit {
    slot_id slot{};
    float distance{};                       /**< cosine distance, 1 - cos */
};

/** \brief Hierarchical Navigable Small World index. */
class HnswIndex {
public:
    static constexpr std::uint32_t kDefaultEfSearch = 50;

    HnswIndex();
    ~HnswIndex();
    HnswIndex(HnswIndex&&) noexcept;
    HnswIndex& operator=(HnswIndex&&) noexcept;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    /** \brief Build an index over a complete corpus.
     *
     * \param dim Vector dimensionality
     * \param vectors Vectors [n][dim]; vectors[i] becomes slot i
     * \param params Build parameters
     * \return Finished index or error
     *
     * Errors: invalid_argument when dim == 0, vectors is empty, any vector is not of
     * length dim, M < 2, or efConstruction < M.
     * Complexity: O(N * log(N) * efConstruction)
     */
    static auto build(std::size_t dim, std::span<const std::vector<float>> vectors,
                      const HnswBuildParams& params = {})
        -> std::expected<HnswIndex, core::error>;

    /** \brief Set the beam width used by subsequent searches (higher = better recall). */
    auto set_query_quality(std::uint32_t ef) -> std::expected<void, core::error>;

    /** \brief Current search beam width. */
    auto query_quality() const noexcept -> std::uint32_t;

    /** \brief Search for the k nearest neighbors of a query.
     *
     * \param query Query vector [dim]
     * \param k Number of neighbors wanted
     * \return min(k, size()) hits ordered by increasing distance (slot id breaks ties)
     *
     * A k larger than size() is clamped, not rejected. k == 0 and a query of the wrong
     * dimension are invalid_argument.
     * Complexity: O(max(ef, k) * log(N))
     * Thread-safety: Safe for concurrent calls
     */
    auto search(std::span<const float> query, std::size_t k) const
        -> std::expected<std::vector<HnswHit>, core::error>;

    /** \brief Save index to file (atomic replace). */
    auto save(const std::string& path) const -> std::expected<void, core::error>;

    /** \brief Load index from file.
     *
     * \param path Input file path
     * \param expected_dim Dimension the caller will query with; 0 skips the check
     * \return Loaded index, or io_failed (missing/unreadable) / data_integrity (corrupt,
     *         truncated, wrong version, checksum or dimension mismatch)
     */
    static auto load(const std::string& path, std::size_t expected_dim = 0)
        -> std::expected<HnswIndex, core::error>;

    /** \brief Get index statistics. */
    auto get_stats() const noexcept -> HnswStats;

    /** \brief Compute reachability on base layer via BFS (testing/diagnostics). */
    auto reachable_count_base_layer() const -> std::size_t;

    auto is_initialized() const noexcept -> bool;
    auto dimension() const noexcept -> std::size_t;
    auto size() const noexcept -> std::size_t;
    auto get_build_params() const noexcept -> HnswBuildParams;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ticketsim::index
