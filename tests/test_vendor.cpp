#include <catch2/catch_all.hpp>

#include "fakes.hpp"
#include "sectioner.hpp"
#include "vendor_extractor.hpp"

#include <string>

TEST_CASE("alias matching tolerates OCR damage", "[vendor]") {
  REQUIRE(vendorAliasHit("autozone", "AUTOZONE STORE #5432"));
  REQUIRE(vendorAliasHit("auto zone", "autozone #12"));
  REQUIRE(vendorAliasHit("autozone", "AUTOZZ store"));
  REQUIRE_FALSE(vendorAliasHit("autozone", "AUTO parts"));
  REQUIRE_FALSE(vendorAliasHit("", "anything"));
}

TEST_CASE("short aliases only match whole words", "[vendor]") {
  REQUIRE(vendorAliasHit("bp", "BP GAS 1234"));
  REQUIRE_FALSE(vendorAliasHit("bp", "BPX 123"));
  REQUIRE_FALSE(vendorAliasHit("wm", "swmp"));
}

TEST_CASE("alias in the top lines", "[vendor]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto vendor = extractVendor(sectionText(autoZoneReceipt()), config);
  REQUIRE(vendor.value == std::string("AutoZone"));
  REQUIRE(vendor.confidence == Catch::Approx(91.0));
  REQUIRE(vendor.provenance == std::string("alias_match:top_full"));
  REQUIRE(vendor.reasoning == "Matched vendor alias 'autozone' in alias_match:top_full.");
}

TEST_CASE("vendor pass outranks the base text", "[vendor]") {
  ExtractorConfig config = defaultExtractorConfig();
  std::string text = std::string("W4LM RT\n") + kVendorPassMarker + "\nWALMART SUPERCENTER\n";
  auto vendor = extractVendor(sectionText(text), config);
  REQUIRE(vendor.value == std::string("Walmart"));
  REQUIRE(vendor.confidence == Catch::Approx(97.0));
  REQUIRE(vendor.provenance == std::string("alias_match:vendor_pass"));
}

TEST_CASE("labeled merchant line", "[vendor]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto vendor = extractVendor(sectionText("Merchant: Blue Heron Books\nTotal 12.00"), config);
  REQUIRE(vendor.value == std::string("Blue Heron Books"));
  REQUIRE(vendor.confidence == Catch::Approx(68.0));
  REQUIRE(vendor.provenance == std::string("labeled_vendor"));
}

TEST_CASE("heuristic guess from an early merchant-like line", "[vendor]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto vendor = extractVendor(sectionText("BLUE HERON BOOKS\n12 Elm Street\nTotal 12.00"), config);
  REQUIRE(vendor.value == std::string("BLUE HERON BOOKS"));
  REQUIRE(vendor.confidence == Catch::Approx(45.6));
  REQUIRE(vendor.provenance == std::string("heuristic_top_line"));
}

TEST_CASE("no vendor signal", "[vendor]") {
  ExtractorConfig config = defaultExtractorConfig();
  auto vendor = extractVendor(sectionText("12.00\n34.00"), config);
  REQUIRE_FALSE(vendor.value);
  REQUIRE(vendor.confidence == 0.0);
  REQUIRE(vendor.reasoning == "No reliable vendor signal found.");

  auto empty = extractVendor(sectionText(""), config);
  REQUIRE_FALSE(empty.value);
}
