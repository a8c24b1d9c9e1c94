#include "receipt_types.hpp"

#include <cmath>
#include <cstdlib>
#include <string>

std::string formatCents(Cents amount) {
  std::string sign = amount < 0 ? "-" : "";
  Cents a = std::llabs(amount);
  std::string cents = std::to_string(a % 100);
  if (cents.size() < 2) cents = "0" + cents;
  return sign + std::to_string(a / 100) + "." + cents;
}

const char* toString(OcrStatus status) {
  switch (status) {
    case OcrStatus::Success: return "success";
    case OcrStatus::LowConfidence: return "low_confidence";
    case OcrStatus::Failed: return "failed";
  }
  return "failed";
}

const char* toString(MoneyEncoding encoding) {
  switch (encoding) {
    case MoneyEncoding::ExplicitDecimal: return "explicit_decimal";
    case MoneyEncoding::EuroStyleComma: return "euro_style_comma";
    case MoneyEncoding::TruncatedDecimal: return "truncated_decimal";
    case MoneyEncoding::ImpliedCents: return "implied_cents";
  }
  return "explicit_decimal";
}

const char* toString(CategorySource source) {
  return source == CategorySource::Rules ? "rules" : "engine";
}

OcrStatus statusFromConfidence(double confidence) {
  if (confidence >= 70.0) return OcrStatus::Success;
  if (confidence >= 35.0) return OcrStatus::LowConfidence;
  return OcrStatus::Failed;
}

double clamp01(double x) {
  if (x < 0.0) return 0.0;
  if (x > 1.0) return 1.0;
  return x;
}

double toConfidence100(double score) {
  return std::round(clamp01(score) * 1000.0) / 10.0;
}
