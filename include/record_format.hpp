#pragma once

#include <string>

#include "receipt_types.hpp"

// JSON string literal body: quotes, backslashes and control characters escaped.
std::string jsonEscape(const std::string& s);

// Two-space indented JSON object with stable field names. Money is printed as
// a decimal number ("45.12"), missing values as null.
std::string toJson(const ExtractionRecord& record);
