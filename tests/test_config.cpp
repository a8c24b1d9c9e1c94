#include <catch2/catch_all.hpp>

#include "config.hpp"
#include "logging.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

TEST_CASE("defaults carry the reference tables", "[config]") {
  ExtractorConfig config = defaultExtractorConfig();
  REQUIRE(config.scoring.vendorAliasBase == Catch::Approx(0.84));
  REQUIRE(config.scoring.moneyMaxCents == 5000000);
  REQUIRE(config.ocr.language == "eng");
  REQUIRE(config.ocr.maxPdfPages == 10);
  REQUIRE(config.tables.vendorAliases.front().canonical == "Walmart");
  REQUIRE(config.tables.noSalesTaxStates.size() == 5);
  REQUIRE_FALSE(config.tables.vendorCategories.empty());
}

TEST_CASE("an empty document keeps the defaults", "[config]") {
  ExtractorConfig config = parseExtractorConfig("");
  REQUIRE(config.scoring.totalLabeledBase == Catch::Approx(0.90));
  REQUIRE(config.tables.vendorAliases.size() == defaultReferenceTables().vendorAliases.size());
}

TEST_CASE("YAML overrides scores, OCR settings and tables", "[config]") {
  ExtractorConfig config = parseExtractorConfig(R"(
scoring:
  vendor_alias_base: 0.5
  date_window_radius: 2
  tax_large_cents: 25000
ocr:
  language: deu
  dpi: 200
  tessdata_path: /opt/tessdata
tables:
  vendor_aliases:
    Acme: [acme, acme co]
  vendor_categories:
    - Acme: Supplies
    - Acme Rentals: Rent
  engine_keywords:
    Travel: [hotel, flight]
  no_sales_tax_states: [OR]
)");

  REQUIRE(config.scoring.vendorAliasBase == Catch::Approx(0.5));
  REQUIRE(config.scoring.dateWindowRadius == 2);
  REQUIRE(config.scoring.taxLargeCents == 25000);
  REQUIRE(config.scoring.vendorPassBump == Catch::Approx(0.10));
  REQUIRE(config.ocr.language == "deu");
  REQUIRE(config.ocr.dpi == 200);
  REQUIRE(config.ocr.tessdataPath == "/opt/tessdata");

  REQUIRE(config.tables.vendorAliases.size() == 1);
  REQUIRE(config.tables.vendorAliases[0].canonical == "Acme");
  REQUIRE(config.tables.vendorAliases[0].aliases.size() == 2);
  REQUIRE(config.tables.vendorCategories ==
          KeyCategoryTable{{"Acme", "Supplies"}, {"Acme Rentals", "Rent"}});
  REQUIRE(config.tables.engineKeywords.size() == 1);
  REQUIRE(config.tables.noSalesTaxStates == std::vector<std::string>{"OR"});
  // untouched tables keep their defaults
  REQUIRE(config.tables.keywordCategories == defaultReferenceTables().keywordCategories);
}

TEST_CASE("malformed configuration is reported", "[config]") {
  REQUIRE_THROWS_WITH(parseExtractorConfig("ocr:\n  max_pdf_pages: 0\n"),
                      Catch::Matchers::StartsWith("Invalid configuration:"));
  REQUIRE_THROWS_AS(parseExtractorConfig("scoring: [1, 2]"), std::runtime_error);
  REQUIRE_THROWS_AS(parseExtractorConfig("scoring:\n  vendor_alias_base: high\n"), std::runtime_error);
  REQUIRE_THROWS_AS(parseExtractorConfig("- just\n- a list\n"), std::runtime_error);
  REQUIRE_THROWS_AS(parseExtractorConfig("tables:\n  vendor_categories: 3\n"), std::runtime_error);
  REQUIRE_THROWS_WITH(loadExtractorConfig("/nonexistent/receiptextract.yaml"),
                      "Cannot read configuration file: /nonexistent/receiptextract.yaml");
}

TEST_CASE("log levels", "[config][logging]") {
  REQUIRE_THROWS_WITH(initLogging("chatty"), "Unknown log level: chatty");
  initLogging("debug");
  REQUIRE(logger()->level() == spdlog::level::debug);
  initLogging("warn");
  REQUIRE(logger()->level() == spdlog::level::warn);
  REQUIRE(logger()->name() == "receiptextract");
}

TEST_CASE("a later initLogging call attaches the file sink", "[config][logging]") {
  auto path = std::filesystem::temp_directory_path() / "receiptextract_logging_test.log";
  std::filesystem::remove(path);

  logger()->warn("before file sink");
  initLogging("info", path.string());
  logger()->info("file sink ready");
  logger()->flush();

  std::ifstream in(path);
  std::stringstream content;
  content << in.rdbuf();
  REQUIRE(content.str().find("file sink ready") != std::string::npos);
  REQUIRE(content.str().find("before file sink") == std::string::npos);

  initLogging("warn");
  std::filesystem::remove(path);
}
