#include <catch2/catch_all.hpp>

#include "record_format.hpp"
#include "review_gate.hpp"

#include <string>

TEST_CASE("JSON string escaping", "[format]") {
  REQUIRE(jsonEscape("plain") == "plain");
  REQUIRE(jsonEscape("a\"b\\c\nd\te") == "a\\\"b\\\\c\\nd\\te");
  REQUIRE(jsonEscape(std::string("x\x01y")) == "x\\u0001y");
}

TEST_CASE("records render with stable field names", "[format]") {
  ScoringConstants sc;
  ExtractionRecord r;
  r.ocr.status = OcrStatus::Success;
  r.ocr.sourceTag = "pdf_text";
  r.ocr.confidence = 95.0;
  r.ocr.text = "GRAND TOTAL $45.12";
  r.total.value = 4512;
  r.total.confidence = 100.0;
  r.total.reasoning = "Strong label match (same line). Source: 'GRAND TOTAL $45.12'";
  r.total.provenance = "strong_label";
  r.vendor.reasoning = "No reliable vendor signal found.";
  r = applyReviewGate(r, sc);

  std::string json = toJson(r);
  REQUIRE(json.find("\"status\": \"success\"") != std::string::npos);
  REQUIRE(json.find("\"source\": \"pdf_text\"") != std::string::npos);
  REQUIRE(json.find("\"total\": {\n    \"value\": 45.12,\n    \"confidence\": 100,") != std::string::npos);
  REQUIRE(json.find("\"provenance\": \"strong_label\"") != std::string::npos);
  REQUIRE(json.find("\"vendor\": {\n    \"value\": null,\n    \"confidence\": 0,") != std::string::npos);
  REQUIRE(json.find("\"category\": {\n    \"value\": null,") != std::string::npos);
  REQUIRE(json.find("\"MISSING_VENDOR\"") != std::string::npos);
  REQUIRE(json.find("\"needsReview\": true") != std::string::npos);
  REQUIRE(json.front() == '{');
}
