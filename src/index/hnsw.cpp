#include "ticketsim/index/hnsw.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <deque>
#include <functional>
#include <limits>
#include <queue>
#include <random>

#include "ticketsim/io/atomic_file.hpp"
#include "ticketsim/io/checksum.hpp"
#include "ticketsim/kernels/distance.hpp"

namespace ticketsim::index {

namespace {

constexpr std::array<char, 8> kMagic{'T', 'K', 'H', 'N', 'S', 'W', '0', '1'};
constexpr std::uint32_t kFormatVersion = 1;
constexpr std::uint32_t kMaxLevel = 32;
constexpr const char* kComponent = "index.hnsw";

using dist_pair = std::pair<float, std::uint32_t>;

auto fail(core::error_code code, std::string message) -> std::unexpected<core::error> {
    return std::unexpected(core::error{code, std::move(message), kComponent});
}

} // namespace

/** \brief Graph node; neighbors[l] holds the adjacency list at layer l (0..level). */
struct HnswNode {
    std::uint32_t level{0};
    std::vector<float> data;
    std::vector<std::vector<std::uint32_t>> neighbors;
};

class HnswIndex::Impl {
public:
    struct State {
        std::size_t dim{0};
        HnswBuildParams params;
        std::uint32_t max_M{0};       /**< cap on upper layers */
        std::uint32_t max_M0{0};      /**< cap on the base layer, 2 * M */
        double level_mult{0.0};       /**< 1 / ln(M) */
        std::uint32_t entry_point{0};
        std::uint32_t max_level{0};
    };

    State state_;
    std::vector<HnswNode> nodes_;
    std::atomic<std::uint32_t> ef_search_{kDefaultEfSearch};

    auto init(std::size_t dim, const HnswBuildParams& params)
        -> std::expected<void, core::error>;

    /** \brief Insert the next slot; the vector must already be unit length. */
    auto insert(std::vector<float> data, std::uint32_t level) -> void;

    auto search(std::span<const float> query, std::size_t k) const
        -> std::expected<std::vector<HnswHit>, core::error>;

    /** \brief Beam search restricted to one layer; result ascending by (distance, id). */
    auto search_layer(std::span<const float> query, std::uint32_t entry_point,
                      std::uint32_t ef, std::uint32_t layer) const
        -> std::vector<dist_pair>;

    /** \brief Diversity heuristic from the HNSW paper (Algorithm 4).
     *
     * Keeps a candidate only if it is closer to the base point than to every neighbor
     * already kept. With keep_pruned_connections, discarded candidates refill the list up
     * to max_connections in distance order.
     */
    auto select_neighbors(const std::vector<dist_pair>& sorted_candidates,
                          std::uint32_t max_connections) const
        -> std::vector<std::uint32_t>;

    auto shrink_connections(std::uint32_t idx, std::uint32_t layer) -> void;

    auto distance(std::uint32_t a, std::uint32_t b) const -> float {
        return kernels::unit_cosine_distance(nodes_[a].data, nodes_[b].data);
    }

    auto layer_cap(std::uint32_t layer) const noexcept -> std::uint32_t {
        return layer == 0 ? state_.max_M0 : state_.max_M;
    }

    auto select_level(std::mt19937& rng) const -> std::uint32_t {
        std::uniform_real_distribution<double> uniform(0.0, 1.0);
        const double r = 1.0 - uniform(rng);   // (0, 1]
        const auto level = static_cast<std::uint32_t>(-std::log(r) * state_.level_mult);
        return std::min(level, kMaxLevel - 1);
    }

    auto reachable_count_base_layer() const -> std::size_t;
};

auto HnswIndex::Impl::init(std::size_t dim, const HnswBuildParams& params)
    -> std::expected<void, core::error> {
    using core::error_code;

    if (dim == 0) {
        return fail(error_code::invalid_argument, "Dimension must be > 0");
    }
    if (params.M < 2) {
        return fail(error_code::invalid_argument, "M must be >= 2");
    }
    if (params.efConstruction < params.M) {
        return fail(error_code::invalid_argument, "efConstruction must be >= M");
    }

    state_.dim = dim;
    state_.params = params;
    state_.max_M = params.M;
    state_.max_M0 = params.M * 2;
    state_.level_mult = 1.0 / std::log(static_cast<double>(params.M));
    state_.entry_point = 0;
    state_.max_level = 0;
    nodes_.clear();
    return {};
}

auto HnswIndex::Impl::search_layer(std::span<const float> query, std::uint32_t entry_point,
                                   std::uint32_t ef, std::uint32_t layer) const
    -> std::vector<dist_pair> {
    const std::size_t N = nodes_.size();

    // Thread-local epoch-based visited marking (avoids hash set overhead)
    struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
    thread_local TLSVisited tls;
    if (tls.seen.size() < N) tls.seen.resize(N, 0);
    tls.epoch++;
    if (tls.epoch == 0) { std::fill(tls.seen.begin(), tls.seen.end(), 0u); tls.epoch = 1; }

    std::priority_queue<dist_pair, std::vector<dist_pair>, std::greater<>> candidates;
    std::priority_queue<dist_pair> nearest;

    const float entry_dist = kernels::unit_cosine_distance(query, nodes_[entry_point].data);
    candidates.emplace(entry_dist, entry_point);
    nearest.emplace(entry_dist, entry_point);
    tls.seen[entry_point] = tls.epoch;

    while (!candidates.empty()) {
        const auto [current_dist, current] = candidates.top();
        if (nearest.size() >= ef && current_dist > nearest.top().first) {
            break;
        }
        candidates.pop();

        for (const std::uint32_t nb : nodes_[current].neighbors[layer]) {
            if (tls.seen[nb] == tls.epoch) continue;
            tls.seen[nb] = tls.epoch;

            const float d = kernels::unit_cosine_distance(query, nodes_[nb].data);
            if (nearest.size() < ef || d < nearest.top().first) {
                candidates.emplace(d, nb);
                nearest.emplace(d, nb);
                if (nearest.size() > ef) nearest.pop();
            }
        }
    }

    std::vector<dist_pair> out;
    out.reserve(nearest.size());
    while (!nearest.empty()) {
        out.push_back(nearest.top());
        nearest.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
}

auto HnswIndex::Impl::select_neighbors(const std::vector<dist_pair>& sorted_candidates,
                                       std::uint32_t max_connections) const
    -> std::vector<std::uint32_t> {
    std::vector<std::uint32_t> kept;
    std::vector<std::uint32_t> discarded;
    kept.reserve(max_connections);

    for (const auto& [d, cand] : sorted_candidates) {
        if (kept.size() >= max_connections) break;
        bool diverse = true;
        for (const std::uint32_t r : kept) {
            if (distance(cand, r) < d) {
                diverse = false;
                break;
            }
        }
        if (diverse) {
            kept.push_back(cand);
        } else {
            discarded.push_back(cand);
        }
    }

    if (state_.params.keep_pruned_connections) {
        for (const std::uint32_t cand : discarded) {
            if (kept.size() >= max_connections) break;
            kept.push_back(cand);
        }
    }
    return kept;
}

auto HnswIndex::Impl::shrink_connections(std::uint32_t idx, std::uint32_t layer) -> void {
    auto& list = nodes_[idx].neighbors[layer];
    const std::uint32_t cap = layer_cap(layer);
    if (list.size() <= cap) return;

    std::vector<dist_pair> scored;
    scored.reserve(list.size());
    for (const std::uint32_t nb : list) {
        scored.emplace_back(distance(idx, nb), nb);
    }
    std::sort(scored.begin(), scored.end());
    list = select_neighbors(scored, cap);
}

auto HnswIndex::Impl::insert(std::vector<float> data, std::uint32_t level) -> void {
    const auto idx = static_cast<std::uint32_t>(nodes_.size());
    HnswNode node;
    node.level = level;
    node.data = std::move(data);
    node.neighbors.resize(level + 1);
    nodes_.push_back(std::move(node));

    if (idx == 0) {
        state_.entry_point = 0;
        state_.max_level = level;
        return;
    }

    const std::span<const float> q = nodes_[idx].data;
    std::uint32_t curr = state_.entry_point;

    // Greedy descent through layers above the new node's top level
    for (std::uint32_t lc = state_.max_level; lc > level; --lc) {
        const auto nearest = search_layer(q, curr, 1, lc);
        curr = nearest.front().second;
    }

    for (std::int64_t lc = std::min(level, state_.max_level); lc >= 0; --lc) {
        const auto layer = static_cast<std::uint32_t>(lc);
        auto found = search_layer(q, curr, state_.params.efConstruction, layer);
        std::erase_if(found, [idx](const dist_pair& p) { return p.second == idx; });

        const auto selected = select_neighbors(found, state_.params.M);
        nodes_[idx].neighbors[layer] = selected;
        for (const std::uint32_t nb : selected) {
            nodes_[nb].neighbors[layer].push_back(idx);
            shrink_connections(nb, layer);
        }
        if (!found.empty()) curr = found.front().second;
    }

    if (level > state_.max_level) {
        state_.max_level = level;
        state_.entry_point = idx;
    }
}

auto HnswIndex::Impl::search(std::span<const float> query, std::size_t k) const
    -> std::expected<std::vector<HnswHit>, core::error> {
    using core::error_code;

    if (nodes_.empty()) {
        return fail(error_code::not_initialized, "Index is empty; build or load first");
    }
    if (k == 0) {
        return fail(error_code::invalid_argument, "k must be > 0");
    }
    if (query.size() != state_.dim) {
        return fail(error_code::invalid_argument,
                    "Query dimension " + std::to_string(query.size()) +
                    " does not match index dimension " + std::to_string(state_.dim));
    }

    std::vector<float> q(query.begin(), query.end());
    kernels::normalize_in_place(q);

    const std::size_t want = std::min(k, nodes_.size());
    const auto ef = static_cast<std::uint32_t>(
        std::max<std::size_t>(ef_search_.load(std::memory_order_relaxed), want));

    std::uint32_t curr = state_.entry_point;
    for (std::uint32_t lc = state_.max_level; lc > 0; --lc) {
        const auto nearest = search_layer(q, curr, 1, lc);
        curr = nearest.front().second;
    }
    const auto found = search_layer(q, curr, ef, 0);

    std::vector<HnswHit> hits;
    hits.reserve(std::min(want, found.size()));
    for (std::size_t i = 0; i < found.size() && i < want; ++i) {
        hits.push_back(HnswHit{found[i].second, found[i].first});
    }
    return hits;
}

auto HnswIndex::Impl::reachable_count_base_layer() const -> std::size_t {
    if (nodes_.empty()) return 0;
    std::vector<bool> seen(nodes_.size(), false);
    std::deque<std::uint32_t> frontier{state_.entry_point};
    seen[state_.entry_point] = true;
    std::size_t count = 1;
    while (!frontier.empty()) {
        const std::uint32_t u = frontier.front();
        frontier.pop_front();
        for (const std::uint32_t v : nodes_[u].neighbors[0]) {
            if (!seen[v]) {
                seen[v] = true;
                ++count;
                frontier.push_back(v);
            }
        }
    }
    return count;
}

// HnswIndex public interface

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;
HnswIndex::HnswIndex(HnswIndex&&) noexcept = default;
HnswIndex& HnswIndex::operator=(HnswIndex&&) noexcept = default;

auto HnswIndex::build(std::size_t dim, std::span<const std::vector<float>> vectors,
                      const HnswBuildParams& params)
    -> std::expected<HnswIndex, core::error> {
    using core::error_code;

    if (vectors.empty()) {
        return fail(error_code::invalid_argument, "Cannot build an index from zero vectors");
    }
    if (vectors.size() > std::numeric_limits<std::uint32_t>::max()) {
        return fail(error_code::invalid_argument, "Too many vectors for 32-bit slot ids");
    }

    HnswIndex index;
    if (auto r = index.impl_->init(dim, params); !r) {
        return std::unexpected(r.error());
    }
    for (std::size_t i = 0; i < vectors.size(); ++i) {
        if (vectors[i].size() != dim) {
            return fail(error_code::invalid_argument,
                        "Vector " + std::to_string(i) + " has dimension " +
                        std::to_string(vectors[i].size()) + ", expected " + std::to_string(dim));
        }
    }

    auto& impl = *index.impl_;
    impl.nodes_.reserve(vectors.size());
    std::mt19937 rng(params.seed);
    for (const auto& v : vectors) {
        std::vector<float> unit(v.begin(), v.end());
        kernels::normalize_in_place(unit);
        impl.insert(std::move(unit), impl.select_level(rng));
    }
    return index;
}

auto HnswIndex::set_query_quality(std::uint32_t ef) -> std::expected<void, core::error> {
    if (ef == 0) {
        return fail(core::error_code::invalid_argument, "ef must be > 0");
    }
    impl_->ef_search_.store(ef, std::memory_order_relaxed);
    return {};
}

auto HnswIndex::query_quality() const noexcept -> std::uint32_t {
    return impl_->ef_search_.load(std::memory_order_relaxed);
}

auto HnswIndex::search(std::span<const float> query, std::size_t k) const
    -> std::expected<std::vector<HnswHit>, core::error> {
    return impl_->search(query, k);
}

auto HnswIndex::save(const std::string& path) const -> std::expected<void, core::error> {
    const auto& impl = *impl_;
    if (impl.nodes_.empty()) {
        return fail(core::error_code::not_initialized, "Cannot save an empty index");
    }

    io::byte_writer w;
    w.put_bytes(kMagic.data(), kMagic.size());
    w.put(kFormatVersion);
    w.put(static_cast<std::uint64_t>(impl.state_.dim));
    w.put(static_cast<std::uint64_t>(impl.nodes_.size()));
    w.put(impl.state_.params.M);
    w.put(impl.state_.params.efConstruction);
    w.put(impl.state_.params.seed);
    w.put(static_cast<std::uint8_t>(impl.state_.params.keep_pruned_connections ? 1 : 0));
    w.put(impl.ef_search_.load(std::memory_order_relaxed));
    w.put(impl.state_.entry_point);
    w.put(impl.state_.max_level);

    for (const auto& node : impl.nodes_) {
        w.put(node.level);
        w.put_bytes(node.data.data(), node.data.size() * sizeof(float));
        for (const auto& list : node.neighbors) {
            w.put(static_cast<std::uint32_t>(list.size()));
            w.put_bytes(list.data(), list.size() * sizeof(std::uint32_t));
        }
    }
    w.put(io::crc32c(w.bytes()));

    return io::write_file_atomic(path, w.bytes());
}

auto HnswIndex::load(const std::string& path, std::size_t expected_dim)
    -> std::expected<HnswIndex, core::error> {
    using core::error_code;

    auto file = io::read_file(path);
    if (!file) {
        return std::unexpected(file.error());
    }
    const std::vector<std::uint8_t>& bytes = *file;

    constexpr std::size_t kMinSize = kMagic.size() + sizeof(std::uint32_t) * 2;
    if (bytes.size() < kMinSize) {
        return fail(error_code::data_integrity, "Index file truncated: " + path);
    }

    const std::size_t body_size = bytes.size() - sizeof(std::uint32_t);
    std::uint32_t stored_crc = 0;
    std::memcpy(&stored_crc, bytes.data() + body_size, sizeof(stored_crc));
    const std::span<const std::uint8_t> body(bytes.data(), body_size);
    if (io::crc32c(body) != stored_crc) {
        return fail(error_code::data_integrity, "Index checksum mismatch: " + path);
    }

    io::byte_reader r(body);
    std::array<char, 8> magic{};
    std::uint32_t version = 0;
    if (!r.get_bytes(magic.data(), magic.size()) || magic != kMagic) {
        return fail(error_code::data_integrity, "Bad index magic: " + path);
    }
    if (!r.get(version) || version != kFormatVersion) {
        return fail(error_code::data_integrity,
                    "Unsupported index format version " + std::to_string(version));
    }

    std::uint64_t dim = 0;
    std::uint64_t count = 0;
    HnswBuildParams params;
    std::uint8_t keep_pruned = 0;
    std::uint32_t ef_search = 0;
    std::uint32_t entry_point = 0;
    std::uint32_t max_level = 0;
    const bool header_ok = r.get(dim) && r.get(count) && r.get(params.M) &&
                           r.get(params.efConstruction) && r.get(params.seed) &&
                           r.get(keep_pruned) && r.get(ef_search) && r.get(entry_point) &&
                           r.get(max_level);
    if (!header_ok) {
        return fail(error_code::data_integrity, "Index header truncated: " + path);
    }
    if (expected_dim != 0 && dim != expected_dim) {
        return fail(error_code::data_integrity,
                    "Index dimension mismatch: file has " + std::to_string(dim) +
                    ", expected " + std::to_string(expected_dim));
    }
    if (dim == 0 || count == 0 || count > std::numeric_limits<std::uint32_t>::max() ||
        entry_point >= count || max_level >= kMaxLevel || ef_search == 0) {
        return fail(error_code::data_integrity, "Index header out of range: " + path);
    }
    // Every node needs at least its level and vector; reject counts the body cannot hold.
    if (dim > r.remaining() / sizeof(float) ||
        count > r.remaining() / (sizeof(std::uint32_t) * 2 + dim * sizeof(float))) {
        return fail(error_code::data_integrity, "Index body truncated: " + path);
    }
    params.keep_pruned_connections = keep_pruned != 0;

    HnswIndex index;
    auto& impl = *index.impl_;
    if (auto init = impl.init(static_cast<std::size_t>(dim), params); !init) {
        return fail(error_code::data_integrity, "Invalid build parameters in " + path +
                                                ": " + init.error().message);
    }
    impl.ef_search_.store(ef_search, std::memory_order_relaxed);
    impl.state_.entry_point = entry_point;
    impl.state_.max_level = max_level;
    impl.nodes_.resize(static_cast<std::size_t>(count));

    for (std::uint32_t i = 0; i < count; ++i) {
        auto& node = impl.nodes_[i];
        if (!r.get(node.level) || node.level > max_level) {
            return fail(error_code::data_integrity, "Bad level for node " + std::to_string(i));
        }
        node.data.resize(static_cast<std::size_t>(dim));
        if (!r.get_bytes(node.data.data(), node.data.size() * sizeof(float))) {
            return fail(error_code::data_integrity, "Index body truncated: " + path);
        }
        node.neighbors.resize(node.level + 1);
        for (auto& list : node.neighbors) {
            std::uint32_t n = 0;
            if (!r.get(n) || n > count || n > r.remaining() / sizeof(std::uint32_t)) {
                return fail(error_code::data_integrity, "Index body truncated: " + path);
            }
            list.resize(n);
            if (!r.get_bytes(list.data(), n * sizeof(std::uint32_t))) {
                return fail(error_code::data_integrity, "Index body truncated: " + path);
            }
            for (const std::uint32_t nb : list) {
                if (nb >= count || nb == i) {
                    return fail(error_code::data_integrity,
                                "Neighbor id out of range for node " + std::to_string(i));
                }
            }
        }
    }
    if (r.remaining() != 0) {
        return fail(error_code::data_integrity, "Trailing bytes in index file: " + path);
    }
    if (impl.nodes_[entry_point].level != max_level) {
        return fail(error_code::data_integrity, "Entry point is not on the top level");
    }
    // Upper-layer edges must point at nodes that exist on that layer.
    for (const auto& node : impl.nodes_) {
        for (std::uint32_t l = 1; l < node.neighbors.size(); ++l) {
            for (const std::uint32_t nb : node.neighbors[l]) {
                if (impl.nodes_[nb].level < l) {
                    return fail(error_code::data_integrity, "Neighbor below its layer");
                }
            }
        }
    }
    return index;
}

auto HnswIndex::get_stats() const noexcept -> HnswStats {
    HnswStats stats;
    const auto& impl = *impl_;
    stats.n_nodes = impl.nodes_.size();
    if (impl.nodes_.empty()) return stats;

    stats.n_levels = impl.state_.max_level + 1;
    stats.level_counts.assign(stats.n_levels, 0);
    std::size_t edge_ids = 0;
    for (const auto& node : impl.nodes_) {
        stats.n_edges += node.neighbors[0].size();
        stats.level_counts[node.level]++;
        for (const auto& list : node.neighbors) edge_ids += list.size();
    }
    stats.avg_degree = static_cast<float>(stats.n_edges) / static_cast<float>(stats.n_nodes);
    stats.memory_bytes = impl.nodes_.size() * (sizeof(HnswNode) + impl.state_.dim * sizeof(float)) +
                         edge_ids * sizeof(std::uint32_t);
    return stats;
}

auto HnswIndex::reachable_count_base_layer() const -> std::size_t {
    return impl_->reachable_count_base_layer();
}

auto HnswIndex::is_initialized() const noexcept -> bool {
    return impl_ && !impl_->nodes_.empty();
}

auto HnswIndex::dimension() const noexcept -> std::size_t {
    return impl_->state_.dim;
}

auto HnswIndex::size() const noexcept -> std::size_t {
    return impl_->nodes_.size();
}

auto HnswIndex::get_build_params() const noexcept -> HnswBuildParams {
    return impl_->state_.params;
}

} // namespace ticketsim::index
