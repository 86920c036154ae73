#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "support/fake_providers.hpp"
#include "ticketsim/embedding/embedding_gateway.hpp"

using namespace ticketsim;
using ticketsim::embedding::embedding_gateway;

namespace {

enum class defect { short_batch, wrong_dimension, nan_value };

// Provider that returns structurally broken output.
class broken_provider : public embedding::embedding_provider {
public:
  explicit broken_provider(defect d) : defect_(d) {}
  auto dimension() const noexcept -> std::size_t override { return 4; }
  auto embed_batch(std::span<const std::string> texts) const
      -> std::expected<std::vector<std::vector<float>>, core::error> override {
    std::vector<std::vector<float>> out(texts.size(), std::vector<float>(4, 0.5f));
    switch (defect_) {
      case defect::short_batch: out.pop_back(); break;
      case defect::wrong_dimension: out.front().push_back(1.0f); break;
      case defect::nan_value: out.back()[2] = std::numeric_limits<float>::quiet_NaN(); break;
    }
    return out;
  }

private:
  defect defect_;
};

auto numbered_texts(std::size_t n) -> std::vector<std::string> {
  std::vector<std::string> texts;
  for (std::size_t i = 0; i < n; ++i) texts.push_back("printer issue " + std::to_string(i));
  return texts;
}

} // namespace

TEST_CASE("gateway create validates its inputs", "[embedding][gateway]") {
  auto provider = std::make_shared<test::keyword_embedder>(test::ticket_vocab());

  auto null_provider = embedding_gateway::create(nullptr, 7);
  REQUIRE_FALSE(null_provider.has_value());
  REQUIRE(null_provider.error().code == core::error_code::invalid_argument);

  auto zero_batch = embedding_gateway::create(provider, 7, 0);
  REQUIRE_FALSE(zero_batch.has_value());
  REQUIRE(zero_batch.error().code == core::error_code::invalid_argument);

  auto mismatch = embedding_gateway::create(provider, 384);
  REQUIRE_FALSE(mismatch.has_value());
  REQUIRE(mismatch.error().code == core::error_code::invalid_argument);

  auto ok = embedding_gateway::create(provider, 7);
  REQUIRE(ok.has_value());
  REQUIRE(ok->dimension() == 7);
  REQUIRE(ok->batch_size() == embedding_gateway::kDefaultBatchSize);
}

TEST_CASE("gateway embeds a single text", "[embedding][gateway]") {
  auto provider = std::make_shared<test::keyword_embedder>(test::ticket_vocab());
  auto gw = embedding_gateway::create(provider, 7);
  REQUIRE(gw.has_value());

  auto v = gw->embed("Printer printer WiFi");
  REQUIRE(v.has_value());
  REQUIRE(v->size() == 7);
  REQUIRE((*v)[0] == 2.0f);
  REQUIRE((*v)[1] == 1.0f);
  REQUIRE(provider->calls() == 1);
}

TEST_CASE("gateway splits large batches and keeps input order", "[embedding][gateway]") {
  auto provider = std::make_shared<test::keyword_embedder>(test::ticket_vocab());
  auto gw = embedding_gateway::create(provider, 7);
  REQUIRE(gw.has_value());

  auto texts = numbered_texts(70);
  texts[69] = "vpn timeout";
  auto vecs = gw->embed_batch(texts);
  REQUIRE(vecs.has_value());
  REQUIRE(vecs->size() == 70);
  REQUIRE(provider->batch_sizes() == std::vector<std::size_t>{32, 32, 6});
  REQUIRE((*vecs)[0][0] == 1.0f);
  REQUIRE((*vecs)[69][0] == 0.0f);
  REQUIRE((*vecs)[69][3] == 1.0f);
}

TEST_CASE("gateway honours a custom batch size", "[embedding][gateway]") {
  auto provider = std::make_shared<test::keyword_embedder>(test::ticket_vocab());
  auto gw = embedding_gateway::create(provider, 7, 4);
  REQUIRE(gw.has_value());
  REQUIRE(gw->embed_batch(numbered_texts(9)).has_value());
  REQUIRE(provider->batch_sizes() == std::vector<std::size_t>{4, 4, 1});
}

TEST_CASE("gateway with no texts does not call the provider", "[embedding][gateway]") {
  auto provider = std::make_shared<test::keyword_embedder>(test::ticket_vocab());
  auto gw = embedding_gateway::create(provider, 7);
  REQUIRE(gw.has_value());
  auto vecs = gw->embed_batch({});
  REQUIRE(vecs.has_value());
  REQUIRE(vecs->empty());
  REQUIRE(provider->calls() == 0);
}

TEST_CASE("gateway reports provider failures as provider_failed", "[embedding][gateway][errors]") {
  auto provider = std::make_shared<test::keyword_embedder>(test::ticket_vocab());
  provider->set_failing(true);
  auto gw = embedding_gateway::create(provider, 7);
  REQUIRE(gw.has_value());

  auto single = gw->embed("printer");
  REQUIRE_FALSE(single.has_value());
  REQUIRE(single.error().code == core::error_code::provider_failed);
  REQUIRE(single.error().component == "embedding.gateway");

  auto batch = gw->embed_batch(numbered_texts(3));
  REQUIRE_FALSE(batch.has_value());
  REQUIRE(batch.error().code == core::error_code::provider_failed);
}

TEST_CASE("gateway rejects malformed provider output", "[embedding][gateway][errors]") {
  for (const auto d : {defect::short_batch, defect::wrong_dimension, defect::nan_value}) {
    auto gw = embedding_gateway::create(std::make_shared<broken_provider>(d), 4);
    REQUIRE(gw.has_value());
    auto vecs = gw->embed_batch(numbered_texts(3));
    REQUIRE_FALSE(vecs.has_value());
    REQUIRE(vecs.error().code == core::error_code::provider_failed);
  }
}
