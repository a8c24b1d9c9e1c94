#pragma once

#include "config.hpp"
#include "receipt_types.hpp"
#include "sectioner.hpp"

// Explicit tax lines first (totals pass preferred); otherwise total - subtotal
// when both labeled values were seen and the difference is a plausible rate.
FieldResult<Cents> extractTax(const SectionedText& text, const ExtractorConfig& config);
