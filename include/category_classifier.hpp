#pragma once

#include <optional>
#include <string>

#include "config.hpp"
#include "receipt_types.hpp"

// Business-type hint, then the deterministic rules (vendor table, explanation
// keywords, OCR keywords, business default), then the keyword-count engine.
CategoryResult classifyCategory(const std::optional<std::string>& vendor, const std::string& ocrText,
                                const BusinessContext& context, const ExtractorConfig& config);
