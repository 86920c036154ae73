#include <benchmark/benchmark.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

#include <ticketsim/index/hnsw.hpp>
#include <ticketsim/kernels/distance.hpp>

namespace {

using ticketsim::index::HnswIndex;

constexpr std::size_t kDim = 128;
constexpr std::size_t kRows = 5000;
constexpr std::size_t kQueries = 200;
constexpr std::size_t kTopK = 10;

auto random_unit_vectors(std::size_t n, std::size_t dim, std::uint32_t seed)
    -> std::vector<std::vector<float>> {
  std::mt19937 gen(seed);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<std::vector<float>> out(n, std::vector<float>(dim));
  for (auto& v : out) {
    for (auto& x : v) x = dist(gen);
    ticketsim::kernels::normalize_in_place(v);
  }
  return out;
}

auto exact_top_k(const std::vector<std::vector<float>>& data, const std::vector<float>& q,
                 std::size_t k) -> std::vector<std::uint32_t> {
  std::vector<std::pair<float, std::uint32_t>> d;
  d.reserve(data.size());
  for (std::size_t i = 0; i < data.size(); ++i) {
    d.emplace_back(ticketsim::kernels::unit_cosine_distance(q, data[i]),
                   static_cast<std::uint32_t>(i));
  }
  std::partial_sort(d.begin(), d.begin() + static_cast<std::ptrdiff_t>(k), d.end());
  std::vector<std::uint32_t> ids(k);
  for (std::size_t i = 0; i < k; ++i) ids[i] = d[i].second;
  return ids;
}

// Shared across benchmark runs; building dominates otherwise.
struct fixture {
  std::vector<std::vector<float>> data = random_unit_vectors(kRows, kDim, 7);
  std::vector<std::vector<float>> queries = random_unit_vectors(kQueries, kDim, 11);
  std::vector<std::vector<std::uint32_t>> truth;
  HnswIndex index;

  fixture() {
    for (const auto& q : queries) truth.push_back(exact_top_k(data, q, kTopK));
    if (auto built = HnswIndex::build(kDim, data)) index = std::move(*built);
  }

  static auto get() -> fixture& {
    static fixture f;
    return f;
  }
};

} // namespace

static void BM_HnswBuild(benchmark::State& state) {
  const auto n = static_cast<std::size_t>(state.range(0));
  const auto data = random_unit_vectors(n, kDim, 3);
  for (auto _ : state) {
    auto built = HnswIndex::build(kDim, data);
    if (!built) {
      state.SkipWithError(built.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(built->size());
  }
  state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n));
}
BENCHMARK(BM_HnswBuild)->Arg(1000)->Arg(5000)->Unit(benchmark::kMillisecond);

static void BM_HnswQuery(benchmark::State& state) {
  auto& f = fixture::get();
  if (!f.index.is_initialized()) {
    state.SkipWithError("index build failed");
    return;
  }
  const auto ef = static_cast<std::uint32_t>(state.range(0));
  if (!f.index.set_query_quality(ef)) {
    state.SkipWithError("invalid ef");
    return;
  }

  std::size_t qi = 0;
  std::size_t found = 0;
  std::size_t wanted = 0;
  for (auto _ : state) {
    const auto& q = f.queries[qi];
    auto hits = f.index.search(q, kTopK);
    if (!hits) {
      state.SkipWithError(hits.error().message.c_str());
      break;
    }
    state.PauseTiming();
    const std::unordered_set<std::uint32_t> expected(f.truth[qi].begin(), f.truth[qi].end());
    for (const auto& h : *hits) found += expected.count(h.slot);
    wanted += kTopK;
    qi = (qi + 1) % f.queries.size();
    state.ResumeTiming();
  }
  state.counters["recall@10"] =
      wanted ? static_cast<double>(found) / static_cast<double>(wanted) : 0.0;
  state.counters["ef"] = static_cast<double>(ef);
}
BENCHMARK(BM_HnswQuery)->Arg(10)->Arg(50)->Arg(100)->Arg(200);

BENCHMARK_MAIN();
