#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "receipt_types.hpp"

extern const char* const kFlagNoSalesTaxState;
extern const char* const kFlagPipelineFault;
extern const char* const kFlagCategoryEngineError;

// Quality flags for the record in rule order. Flags already on the record that
// the gate does not own are carried after them, upper-cased; duplicates are
// dropped keeping the first occurrence.
std::vector<std::string> computeReviewFlags(const ExtractionRecord& record, const ScoringConstants& scoring);

// Sets flags and needsReview (true exactly when flags is non-empty).
ExtractionRecord applyReviewGate(ExtractionRecord record, const ScoringConstants& scoring);
