#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>

#include "ticketsim/config.hpp"
#include "ticketsim/logging.hpp"

using namespace ticketsim;
using Catch::Approx;

namespace {

// Sets a variable for the lifetime of the guard.
class scoped_env {
public:
  scoped_env(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~scoped_env() { ::unsetenv(name_); }
  scoped_env(const scoped_env&) = delete;
  scoped_env& operator=(const scoped_env&) = delete;

private:
  const char* name_;
};

} // namespace

TEST_CASE("defaults describe the MiniLM deployment", "[config]") {
  const settings s;
  REQUIRE(s.matcher.dimension == 384);
  REQUIRE(s.matcher.hnsw.M == 16);
  REQUIRE(s.matcher.hnsw.efConstruction == 200);
  REQUIRE(s.matcher.ef_search == 50);
  REQUIRE(s.matcher.default_k == 3);
  REQUIRE(s.matcher.similarity_threshold == Approx(0.5f));
  REQUIRE(s.embedding.dimension == s.matcher.dimension);
  REQUIRE(s.chat.api_key_env == "HUGGINGFACE_API_KEY");
  REQUIRE(validate(s.matcher).has_value());
}

TEST_CASE("environment overlays the base settings", "[config][env]") {
  scoped_env dim("TICKETSIM_DIM", "768");
  scoped_env ef("TICKETSIM_EF_SEARCH", "120");
  scoped_env thr("TICKETSIM_THRESHOLD", "0.35");
  scoped_env idx("TICKETSIM_INDEX_PATH", "/var/lib/ticketsim/tickets.hnsw");
  scoped_env model("TICKETSIM_EMBED_MODEL", "nomic-embed-text");

  settings base;
  base.matcher.default_k = 5;
  auto s = config_from_env(base);
  REQUIRE(s.has_value());
  REQUIRE(s->matcher.dimension == 768);
  REQUIRE(s->embedding.dimension == 768);
  REQUIRE(s->matcher.ef_search == 120);
  REQUIRE(s->matcher.similarity_threshold == Approx(0.35f));
  REQUIRE(s->matcher.index_path == "/var/lib/ticketsim/tickets.hnsw");
  REQUIRE(s->embedding.model == "nomic-embed-text");
  REQUIRE(s->matcher.default_k == 5);
}

TEST_CASE("malformed numbers are config_invalid", "[config][env][errors]") {
  scoped_env m("TICKETSIM_M", "sixteen");
  auto s = config_from_env();
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.error().code == core::error_code::config_invalid);
}

TEST_CASE("overlaid values are validated", "[config][env][errors]") {
  scoped_env k("TICKETSIM_TOP_K", "0");
  auto s = config_from_env();
  REQUIRE_FALSE(s.has_value());
  REQUIRE(s.error().code == core::error_code::config_invalid);
}

TEST_CASE("validate rejects out-of-range fields", "[config][errors]") {
  auto expect_invalid = [](matcher_config c) {
    auto r = validate(c);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::config_invalid);
  };
  matcher_config c;
  c.dimension = 0;
  expect_invalid(c);
  c = {};
  c.hnsw.M = 1;
  expect_invalid(c);
  c = {};
  c.hnsw.efConstruction = 8;
  expect_invalid(c);
  c = {};
  c.ef_search = 0;
  expect_invalid(c);
  c = {};
  c.embed_batch_size = 0;
  expect_invalid(c);
  c = {};
  c.similarity_threshold = 1.5f;
  expect_invalid(c);
}

TEST_CASE("log level names", "[config][logging]") {
  REQUIRE(parse_log_level("debug") == spdlog::level::debug);
  REQUIRE(parse_log_level("warning") == spdlog::level::warn);
  REQUIRE_FALSE(parse_log_level("verbose").has_value());

  {
    scoped_env lvl("TICKETSIM_LOG_LEVEL", "verbose");
    auto r = configure_logging();
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::config_invalid);
  }
  {
    scoped_env lvl("TICKETSIM_LOG_LEVEL", "warn");
    REQUIRE(configure_logging().has_value());
    REQUIRE(spdlog::get_level() == spdlog::level::warn);
  }
}
