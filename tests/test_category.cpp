#include <catch2/catch_all.hpp>

#include "category_classifier.hpp"

#include <optional>
#include <string>

namespace {

BusinessContext context(const std::string& explanation, const std::string& businessType = "") {
  BusinessContext ctx;
  ctx.explanation = explanation;
  ctx.businessType = businessType;
  return ctx;
}

} // namespace

TEST_CASE("vendor table match", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto result = classifyCategory(std::string("AutoZone"), "", {}, config);
  REQUIRE(result.category == std::string("Car & Truck"));
  REQUIRE(result.confidence == Catch::Approx(0.95));
  REQUIRE(result.source == CategorySource::Rules);
}

TEST_CASE("longest vendor key wins", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto result = classifyCategory(std::string("Home Depot Tool Rental"), "", {}, config);
  REQUIRE(result.category == std::string("Equipment"));
  REQUIRE(result.reasoning.find("'Home Depot Tool Rental'") != std::string::npos);
}

TEST_CASE("business type hint pre-empts the rules", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto result = classifyCategory(std::string("Starbucks"), "", context("Brake pad and rotor for the van", "Mechanic"),
                                 config);
  REQUIRE(result.category == std::string("Car & Truck"));
  REQUIRE(result.confidence == Catch::Approx(0.90));
  REQUIRE(result.source == CategorySource::Engine);
  REQUIRE(result.reasoning == "Matched business_type='Mechanic' hint in explanation");
}

TEST_CASE("keyword rules: explanation before OCR text", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();

  auto fromExplanation = classifyCategory(std::nullopt, "Unleaded PUMP 04", context("client lunch"), config);
  REQUIRE(fromExplanation.category == std::string("Meals"));
  REQUIRE(fromExplanation.confidence == Catch::Approx(0.80));
  REQUIRE(fromExplanation.reasoning == "Explanation rule: Keyword mapping matched: 'lunch'");

  auto fromOcr = classifyCategory(std::nullopt, "Unleaded PUMP 04", {}, config);
  REQUIRE(fromOcr.category == std::string("Fuel"));
  REQUIRE(fromOcr.reasoning == "OCR rule: Keyword mapping matched: 'pump'");
}

TEST_CASE("business type default", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto result = classifyCategory(std::nullopt, "zzz", context("", "Photographer"), config);
  REQUIRE(result.category == std::string("Equipment"));
  REQUIRE(result.confidence == Catch::Approx(0.55));
  REQUIRE(result.source == CategorySource::Rules);
}

TEST_CASE("keyword-count engine fallback", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();
  config.tables.keywordCategories.clear();
  config.tables.engineKeywords = {
    {"Travel", {"hotel", "flight"}},
    {"Meals", {"lunch"}},
  };

  auto mostHits = classifyCategory(std::nullopt, "hotel flight lunch", {}, config);
  REQUIRE(mostHits.category == std::string("Travel"));
  REQUIRE(mostHits.confidence == Catch::Approx(0.70));
  REQUIRE(mostHits.source == CategorySource::Engine);

  auto explanation = classifyCategory(std::nullopt, "hotel", context("team lunch"), config);
  REQUIRE(explanation.category == std::string("Meals"));
  REQUIRE(explanation.confidence == Catch::Approx(0.85));

  auto tie = classifyCategory(std::nullopt, "hotel lunch", {}, config);
  REQUIRE(tie.category == std::string("Travel"));
}

TEST_CASE("no category signal", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();
  config.tables = ReferenceTables{};
  auto result = classifyCategory(std::string("Acme"), "zzz", {}, config);
  REQUIRE_FALSE(result.category);
  REQUIRE(result.confidence == 0.0);
  REQUIRE(result.reasoning == "no category match found");
  REQUIRE(result.source == CategorySource::Engine);
}

TEST_CASE("configured keywords match regardless of case", "[category]") {
  ExtractorConfig config = defaultExtractorConfig();
  config.tables.keywordCategories = {{"PARKING  Garage", "Travel"}};
  auto rule = classifyCategory(std::nullopt, "city parking garage level 2", {}, config);
  REQUIRE(rule.category == std::string("Travel"));
  REQUIRE(rule.reasoning == "OCR rule: Keyword mapping matched: 'parking garage'");

  config.tables.keywordCategories.clear();
  config.tables.engineKeywords = {{"Office Expense", {"TONER"}}};
  auto engine = classifyCategory(std::nullopt, "hp toner cartridge", {}, config);
  REQUIRE(engine.category == std::string("Office Expense"));
  REQUIRE(engine.source == CategorySource::Engine);
}
