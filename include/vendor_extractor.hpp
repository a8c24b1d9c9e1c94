#pragma once

#include <string>

#include "config.hpp"
#include "receipt_types.hpp"
#include "sectioner.hpp"

// Forgiving alias test used for OCR-garbled merchant names: exact substring,
// then alphanumeric-only substring, then a guarded 4-character token prefix.
// Aliases shorter than 4 alphanumerics only match as whole words.
bool vendorAliasHit(const std::string& alias, const std::string& haystack);

FieldResult<std::string> extractVendor(const SectionedText& text, const ExtractorConfig& config);
