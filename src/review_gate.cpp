#include "review_gate.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

const char* const kFlagNoSalesTaxState = "NO_SALES_TAX_STATE";
const char* const kFlagPipelineFault = "PIPELINE_FAULT";
const char* const kFlagCategoryEngineError = "CATEGORY_ENGINE_ERROR";

namespace {

const std::vector<std::string> kGateFlags = {
  "TAX_NEGATIVE", "TAX_GT_TOTAL", "TAX_IMPLAUSIBLE_RATE", "OCR_FAILED", "LOW_TOTAL_CONFIDENCE",
  "TOTAL_CONTEXT_WEAK", "LOW_DATE_CONFIDENCE", "LOW_VENDOR_CONFIDENCE", "TAX_MISSING_REVIEW",
  "MISSING_VENDOR", "MISSING_DATE", "MISSING_TOTAL", "MISSING_CATEGORY",
};

const std::vector<std::string> kWeakTotalMarkers = {"unlabeled", "bad context", "weak label match"};

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

void addFlag(std::vector<std::string>& flags, const std::string& flag) {
  if (std::find(flags.begin(), flags.end(), flag) == flags.end()) flags.push_back(flag);
}

} // namespace

std::vector<std::string> computeReviewFlags(const ExtractionRecord& record, const ScoringConstants& scoring) {
  std::vector<std::string> flags;
  const auto& tax = record.tax.value;
  const auto& total = record.total.value;

  if (tax && total) {
    if (*tax < 0) addFlag(flags, "TAX_NEGATIVE");
    if (*tax > *total) addFlag(flags, "TAX_GT_TOTAL");
    if (*total > 0 && static_cast<double>(*tax) / static_cast<double>(*total) > scoring.reviewMaxTaxRate) {
      addFlag(flags, "TAX_IMPLAUSIBLE_RATE");
    }
  }

  if (record.ocr.status == OcrStatus::Failed) addFlag(flags, "OCR_FAILED");

  // confidences of absent fields are 0, so a missing field also reads as low
  bool lowTotal = record.total.confidence < scoring.reviewTotalMinConfidence;
  if (lowTotal) addFlag(flags, "LOW_TOTAL_CONFIDENCE");
  bool weakTotal = containsAny(toLower(record.total.reasoning), kWeakTotalMarkers);
  if (weakTotal) addFlag(flags, "TOTAL_CONTEXT_WEAK");
  if (record.date.confidence < scoring.reviewDateMinConfidence) addFlag(flags, "LOW_DATE_CONFIDENCE");
  if (record.vendor.confidence < scoring.reviewVendorMinConfidence) addFlag(flags, "LOW_VENDOR_CONFIDENCE");
  if (!tax && (lowTotal || weakTotal)) addFlag(flags, "TAX_MISSING_REVIEW");

  if (!record.vendor.value) addFlag(flags, "MISSING_VENDOR");
  if (!record.date.value) addFlag(flags, "MISSING_DATE");
  if (!total) addFlag(flags, "MISSING_TOTAL");
  if (!record.category.category) addFlag(flags, "MISSING_CATEGORY");

  for (const auto& upstream : record.flags) {
    std::string f = toUpper(trim(upstream));
    if (f.empty()) continue;
    if (std::find(kGateFlags.begin(), kGateFlags.end(), f) != kGateFlags.end()) continue;
    addFlag(flags, f);
  }
  return flags;
}

ExtractionRecord applyReviewGate(ExtractionRecord record, const ScoringConstants& scoring) {
  record.flags = computeReviewFlags(record, scoring);
  record.needsReview = !record.flags.empty();
  return record;
}
