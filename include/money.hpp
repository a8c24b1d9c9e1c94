#pragma once

#include <string>
#include <vector>

#include "config.hpp"
#include "receipt_types.hpp"

// Labeled mode additionally decodes implied-cents integers ("4749" -> 47.49);
// use it only for text adjacent to a total/tax label.
enum class MoneyMode { Labeled, Unlabeled };

// Candidate amounts in offset order, deduplicated by (value, offset / 4).
std::vector<MoneyToken> extractMoneyTokens(const std::string& text, MoneyMode mode,
                                           const ScoringConstants& scoring);

// `\d+.\d\d` or a bare 3-6 digit number.
bool hasMoneyShape(const std::string& text);

// total, subtotal, amount due, tax, vat, ... (case-insensitive)
bool hasTotalOrTaxKeyword(const std::string& text);
