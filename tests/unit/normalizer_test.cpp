#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>

#include "ticketsim/text/normalizer.hpp"

using ticketsim::text::normalize;

TEST_CASE("normalize joins fields in issue, category, description order", "[normalizer]") {
  REQUIRE(normalize("Printer offline", "Hardware", "Cannot print") ==
          "Printer offline Hardware Cannot print");
}

TEST_CASE("normalize treats missing fields as empty and trims the ends", "[normalizer]") {
  REQUIRE(normalize(std::nullopt, "Network", "VPN down") == "Network VPN down");
  REQUIRE(normalize("VPN", std::nullopt, std::nullopt) == "VPN");
  REQUIRE(normalize(std::nullopt, std::nullopt, "only description") == "only description");
  REQUIRE(normalize(std::nullopt, std::nullopt, std::nullopt).empty());
}

TEST_CASE("normalize keeps inner spacing when a middle field is missing", "[normalizer]") {
  // Two separators surround the empty category.
  REQUIRE(normalize("Issue", std::nullopt, "Desc") == "Issue  Desc");
  REQUIRE(normalize("Issue", "", "Desc") == "Issue  Desc");
}

TEST_CASE("normalize preserves whitespace inside fields", "[normalizer]") {
  REQUIRE(normalize("  Printer   jam ", "HW", "\tpaper\nstuck\n") ==
          "Printer   jam  HW \tpaper\nstuck");
}

TEST_CASE("normalize of a record matches the field form", "[normalizer]") {
  ticketsim::ticket_record rec;
  rec.id = "T-1";
  rec.issue = "Printer WiFi issue";
  rec.description = "Drops off the network";
  REQUIRE(normalize(rec) == normalize(rec.issue, rec.category, rec.description));
  REQUIRE(normalize(rec) == "Printer WiFi issue  Drops off the network");
}
