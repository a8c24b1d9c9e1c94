#include <catch2/catch_all.hpp>

#include "date_extractor.hpp"
#include "fakes.hpp"

#include <string>

namespace {

const CalendarDate kReference{2026, 10, 19};

FieldResult<std::string> dateOf(const std::string& text) {
  static const ExtractorConfig config = defaultExtractorConfig();
  return extractDate(sectionText(text), config, kReference);
}

} // namespace

TEST_CASE("date near a date label", "[date]") {
  auto date = dateOf(autoZoneReceipt());
  REQUIRE(date.value == std::string("2026-10-02"));
  REQUIRE(date.confidence == Catch::Approx(90.0));
  REQUIRE(date.provenance == std::string("date_label"));
  REQUIRE(date.reasoning.find("mdy_slash") != std::string::npos);
  REQUIRE(date.reasoning.find("DATE 10/02/2026") != std::string::npos);
}

TEST_CASE("unlabeled date from the top lines", "[date]") {
  auto date = dateOf("ACME\n2026-03-15\n");
  REQUIRE(date.value == std::string("2026-03-15"));
  REQUIRE(date.confidence == Catch::Approx(74.0));
  REQUIRE(date.provenance == std::string("top_full"));
}

TEST_CASE("month name forms", "[date]") {
  REQUIRE(dateOf("Invoice Date: March 5, 2026").value == std::string("2026-03-05"));
  REQUIRE(dateOf("Issued 5 Sept 2025").value == std::string("2025-09-05"));
}

TEST_CASE("two-digit years pivot at 68", "[date]") {
  auto future = dateOf("DATE 01/02/68");
  REQUIRE(future.value == std::string("2068-01-02"));
  REQUIRE(future.confidence == Catch::Approx(51.0));
  REQUIRE(future.reasoning.find("far-future") != std::string::npos);

  auto old = dateOf("DATE 01/02/69");
  REQUIRE(old.value == std::string("1969-01-02"));
  REQUIRE(old.confidence == Catch::Approx(71.0));
}

TEST_CASE("invalid calendar dates are dropped", "[date]") {
  auto bad = dateOf("DATE 13/45/2026");
  REQUIRE_FALSE(bad.value);
  REQUIRE(bad.confidence == 0.0);
  REQUIRE(bad.reasoning == "No date pattern detected.");

  REQUIRE_FALSE(dateOf("DATE 02/30/2026").value);
  REQUIRE_FALSE(dateOf("DATE 01/02/026").value);
}

TEST_CASE("plausible dates beat far-future ones", "[date]") {
  auto date = dateOf("DATE 01/05/2030\nDATE 01/05/2026");
  REQUIRE(date.value == std::string("2026-01-05"));
}

TEST_CASE("calendar arithmetic", "[date]") {
  REQUIRE(CalendarDate{2024, 2, 29}.addYears(1).iso() == "2025-02-28");
  REQUIRE(CalendarDate{2024, 2, 29}.addYears(4).iso() == "2028-02-29");
  REQUIRE(CalendarDate{2026, 1, 1} < CalendarDate{2026, 1, 2});
  REQUIRE(isValidDate(2000, 2, 29));
  REQUIRE_FALSE(isValidDate(1900, 2, 29));
}
