#include <catch2/catch_all.hpp>

#include "review_gate.hpp"

#include <string>
#include <vector>

using Flags = std::vector<std::string>;

namespace {

ExtractionRecord cleanRecord() {
  ExtractionRecord r;
  r.ocr.status = OcrStatus::Success;
  r.ocr.confidence = 95.0;
  r.vendor = {std::string("AutoZone"), 91.0, "alias", std::string("alias_match:top_full")};
  r.date = {std::string("2026-10-02"), 90.0, "label", std::string("date_label")};
  r.tax = {Cents{312}, 88.0, "tax", std::string("tax_label:full")};
  r.total = {Cents{4512}, 100.0, "Labeled total window", std::string("strong_label")};
  r.category.category = "Car & Truck";
  r.category.confidence = 0.95;
  return r;
}

} // namespace

TEST_CASE("a clean record needs no review", "[review]") {
  ScoringConstants sc;
  ExtractionRecord r = applyReviewGate(cleanRecord(), sc);
  REQUIRE(r.flags.empty());
  REQUIRE_FALSE(r.needsReview);
}

TEST_CASE("tax sanity against the total", "[review]") {
  ScoringConstants sc;
  ExtractionRecord r = cleanRecord();
  r.tax.value = 5000;
  REQUIRE(computeReviewFlags(r, sc) == Flags{"TAX_GT_TOTAL", "TAX_IMPLAUSIBLE_RATE"});

  r.tax.value = -5;
  REQUIRE(computeReviewFlags(r, sc) == Flags{"TAX_NEGATIVE"});
}

TEST_CASE("an empty record collects every missing and low flag in order", "[review]") {
  ScoringConstants sc;
  ExtractionRecord r = applyReviewGate(ExtractionRecord{}, sc);
  REQUIRE(r.flags == Flags{"OCR_FAILED", "LOW_TOTAL_CONFIDENCE", "LOW_DATE_CONFIDENCE", "LOW_VENDOR_CONFIDENCE",
                           "TAX_MISSING_REVIEW", "MISSING_VENDOR", "MISSING_DATE", "MISSING_TOTAL",
                           "MISSING_CATEGORY"});
  REQUIRE(r.needsReview);
}

TEST_CASE("weak total context is flagged even at high confidence", "[review]") {
  ScoringConstants sc;
  ExtractionRecord r = cleanRecord();
  r.total.reasoning = "Labeled total window ; Weak label match. Source: 'Total 21.50'";
  r.tax.value.reset();
  REQUIRE(computeReviewFlags(r, sc) == Flags{"TOTAL_CONTEXT_WEAK", "TAX_MISSING_REVIEW"});

  r.total.reasoning = "Unlabeled candidate";
  REQUIRE(computeReviewFlags(r, sc) == Flags{"TOTAL_CONTEXT_WEAK", "TAX_MISSING_REVIEW"});
}

TEST_CASE("low confidence thresholds", "[review]") {
  ScoringConstants sc;
  ExtractionRecord r = cleanRecord();
  r.total.confidence = 79.9;
  r.date.confidence = 69.9;
  r.vendor.confidence = 70.0;
  REQUIRE(computeReviewFlags(r, sc) == Flags{"LOW_TOTAL_CONFIDENCE", "LOW_DATE_CONFIDENCE"});
}

TEST_CASE("low OCR confidence alone is not flagged", "[review]") {
  ScoringConstants sc;
  ExtractionRecord r = cleanRecord();
  r.ocr.status = OcrStatus::LowConfidence;
  REQUIRE(computeReviewFlags(r, sc).empty());
}

TEST_CASE("upstream flags are kept and gate flags recomputed", "[review]") {
  ScoringConstants sc;
  ExtractionRecord r = cleanRecord();
  r.flags = {"no_sales_tax_state", "MISSING_TOTAL", " ", "NO_SALES_TAX_STATE"};
  ExtractionRecord gated = applyReviewGate(r, sc);
  REQUIRE(gated.flags == Flags{"NO_SALES_TAX_STATE"});
  REQUIRE(gated.needsReview);

  ExtractionRecord again = applyReviewGate(gated, sc);
  REQUIRE(again.flags == gated.flags);
}
