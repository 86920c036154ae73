#include <catch2/catch_all.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

#include "support/temp_dir.hpp"
#include "ticketsim/index/hnsw.hpp"
#include "ticketsim/io/atomic_file.hpp"

using namespace ticketsim;
using ticketsim::index::HnswIndex;

namespace {

auto random_vectors(std::size_t n, std::size_t dim, std::uint32_t seed)
    -> std::vector<std::vector<float>> {
  std::mt19937 gen(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<std::vector<float>> out(n, std::vector<float>(dim));
  for (auto& v : out)
    for (auto& x : v) x = dist(gen);
  return out;
}

void overwrite(const std::filesystem::path& p, const std::vector<std::uint8_t>& bytes) {
  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

} // namespace

TEST_CASE("HNSW save/load round trip is bit-identical", "[hnsw][persistence]") {
  test::temp_dir dir("ticketsim_hnsw_rt");
  const auto path = dir.file("tickets.hnsw").string();
  const auto data = random_vectors(250, 16, 11);

  auto built = HnswIndex::build(16, data);
  REQUIRE(built.has_value());
  REQUIRE(built->set_query_quality(64).has_value());
  REQUIRE(built->save(path).has_value());
  REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

  auto loaded = HnswIndex::load(path, 16);
  REQUIRE(loaded.has_value());
  REQUIRE(loaded->size() == built->size());
  REQUIRE(loaded->dimension() == 16);
  REQUIRE(loaded->query_quality() == 64);
  REQUIRE(loaded->get_build_params().M == built->get_build_params().M);
  REQUIRE(loaded->get_build_params().efConstruction == built->get_build_params().efConstruction);
  REQUIRE(loaded->get_stats().n_edges == built->get_stats().n_edges);

  const auto queries = random_vectors(25, 16, 77);
  for (const auto& q : queries) {
    auto a = built->search(q, 8);
    auto b = loaded->search(q, 8);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->size() == b->size());
    for (std::size_t i = 0; i < a->size(); ++i) {
      REQUIRE((*a)[i].slot == (*b)[i].slot);
      REQUIRE((*a)[i].distance == (*b)[i].distance);
    }
  }
}

TEST_CASE("HNSW load reports a missing file as io_failed", "[hnsw][persistence][errors]") {
  test::temp_dir dir("ticketsim_hnsw_missing");
  auto r = HnswIndex::load(dir.file("nope.hnsw").string(), 16);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::io_failed);
  REQUIRE(core::is_persistence_error(r.error().code));
}

TEST_CASE("HNSW load detects corruption and truncation", "[hnsw][persistence][errors]") {
  test::temp_dir dir("ticketsim_hnsw_corrupt");
  const auto path = dir.file("tickets.hnsw");
  auto built = HnswIndex::build(8, random_vectors(40, 8, 5));
  REQUIRE(built.has_value());
  REQUIRE(built->save(path.string()).has_value());

  auto original = io::read_file(path);
  REQUIRE(original.has_value());

  SECTION("flipped byte in the body") {
    auto bytes = *original;
    bytes[bytes.size() / 2] ^= 0x5A;
    overwrite(path, bytes);
    auto r = HnswIndex::load(path.string(), 8);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::data_integrity);
  }
  SECTION("truncated file") {
    auto bytes = *original;
    bytes.resize(bytes.size() - 37);
    overwrite(path, bytes);
    auto r = HnswIndex::load(path.string(), 8);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::data_integrity);
  }
  SECTION("not an index at all") {
    overwrite(path, std::vector<std::uint8_t>{'h', 'e', 'l', 'l', 'o'});
    auto r = HnswIndex::load(path.string(), 8);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::data_integrity);
  }
}

TEST_CASE("HNSW load rejects a dimension mismatch", "[hnsw][persistence][errors]") {
  test::temp_dir dir("ticketsim_hnsw_dim");
  const auto path = dir.file("tickets.hnsw").string();
  auto built = HnswIndex::build(8, random_vectors(20, 8, 9));
  REQUIRE(built.has_value());
  REQUIRE(built->save(path).has_value());

  auto r = HnswIndex::load(path, 384);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::data_integrity);
  REQUIRE(core::is_persistence_error(r.error().code));

  // expected_dim == 0 skips the check
  auto any = HnswIndex::load(path, 0);
  REQUIRE(any.has_value());
  REQUIRE(any->dimension() == 8);
}

TEST_CASE("HNSW save of an empty index is refused", "[hnsw][persistence][errors]") {
  test::temp_dir dir("ticketsim_hnsw_empty");
  HnswIndex empty;
  auto r = empty.save(dir.file("empty.hnsw").string());
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::not_initialized);
  REQUIRE_FALSE(std::filesystem::exists(dir.file("empty.hnsw")));
}
