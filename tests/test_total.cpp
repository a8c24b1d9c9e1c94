#include <catch2/catch_all.hpp>

#include "fakes.hpp"
#include "sectioner.hpp"
#include "total_extractor.hpp"

#include <optional>
#include <string>

namespace {

FieldResult<Cents> totalOf(const std::string& text, std::optional<Cents> tax = std::nullopt) {
  static const ExtractorConfig config = defaultExtractorConfig();
  return extractTotal(sectionText(text), config, tax);
}

} // namespace

TEST_CASE("strong label on the same line", "[total]") {
  auto total = totalOf(autoZoneReceipt(), Cents{312});
  REQUIRE(total.value == Cents{4512});
  REQUIRE(total.confidence == Catch::Approx(100.0));
  REQUIRE(total.provenance == std::string("strong_label"));
  REQUIRE(total.reasoning.find("Strong label match (same line)") != std::string::npos);
}

TEST_CASE("strong label with the amount on the next line", "[total]") {
  auto total = totalOf("AMOUNT DUE\n$45.12\n");
  REQUIRE(total.value == Cents{4512});
  REQUIRE(total.confidence == Catch::Approx(98.0));
  REQUIRE(total.provenance == std::string("strong_label_window"));
}

TEST_CASE("bare total label", "[total]") {
  auto total = totalOf("Subtotal 20.00\nTotal 21.50\n", Cents{150});
  REQUIRE(total.value == Cents{2150});
  REQUIRE(total.confidence == Catch::Approx(96.0));
  REQUIRE(total.provenance == std::string("weak_label_window"));
  REQUIRE(total.reasoning.find("Weak label match") != std::string::npos);
}

TEST_CASE("unlabeled fallback and tax collision", "[total]") {
  auto total = totalOf("ACME\n12.50\n");
  REQUIRE(total.value == Cents{1250});
  REQUIRE(total.confidence == Catch::Approx(58.0));
  REQUIRE(total.provenance == std::string("global_fallback"));
  REQUIRE(total.reasoning.find("Unlabeled candidate") != std::string::npos);

  auto collided = totalOf("ACME\n12.50\n", Cents{1250});
  REQUIRE(collided.confidence == Catch::Approx(23.0));
}

TEST_CASE("loosened fallback reads bad-context lines last", "[total]") {
  auto total = totalOf("CASH 20.00\n");
  REQUIRE(total.value == Cents{2000});
  REQUIRE(total.confidence == Catch::Approx(18.0));
  REQUIRE(total.provenance == std::string("loosened_fallback"));
}

TEST_CASE("keywords without amounts give no total", "[total]") {
  auto total = totalOf("TOTAL\nTAX\nTHANK YOU\n");
  REQUIRE_FALSE(total.value);
  REQUIRE(total.confidence == 0.0);
  REQUIRE(total.reasoning == "No money candidates found.");
}

TEST_CASE("SKUs and three-decimal numerals never become the total", "[total]") {
  REQUIRE_FALSE(totalOf("ITEM 797860\nTHANK YOU\n").value);
  auto total = totalOf("TOTAL 797.860\n");
  REQUIRE_FALSE(total.value);
}

TEST_CASE("totals under one dollar are penalized", "[total]") {
  auto total = totalOf("GRAND TOTAL 0.50\n");
  REQUIRE(total.value == Cents{50});
  REQUIRE(total.confidence == Catch::Approx(78.0));
  REQUIRE(total.reasoning.find("Penalized: too small") != std::string::npos);
}

TEST_CASE("totals over twenty thousand dollars are penalized", "[total]") {
  auto total = totalOf("GRAND TOTAL 25,000.50\n");
  REQUIRE(total.value == Cents{2500050});
  REQUIRE(total.confidence == Catch::Approx(83.0));
  REQUIRE(total.reasoning.find("Penalized: unusually large") != std::string::npos);
}

TEST_CASE("tax wording near a total is penalized", "[total]") {
  auto total = totalOf("GRAND TOTAL INCL TAX 45.12\n");
  REQUIRE(total.value == Cents{4512});
  REQUIRE(total.confidence == Catch::Approx(73.0));
  REQUIRE(total.reasoning.find("Penalized: tax context") != std::string::npos);
}

TEST_CASE("a strong label overrides bad-context words on its line", "[total]") {
  auto total = totalOf("GRAND TOTAL VISA 45.12\n");
  REQUIRE(total.value == Cents{4512});
  REQUIRE(total.confidence == Catch::Approx(100.0));
  REQUIRE(total.provenance == std::string("strong_label"));
  REQUIRE(total.reasoning.find("Penalized: bad context") == std::string::npos);
}
