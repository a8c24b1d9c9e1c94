#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Money is carried as integer cents so two-decimal amounts stay exact.
using Cents = std::int64_t;

enum class OcrStatus { Success, LowConfidence, Failed };

struct OcrResult {
  std::string text;
  OcrStatus status = OcrStatus::Failed;
  std::string sourceTag;
  double confidence = 0.0;  // 0..100
};

enum class MoneyEncoding { ExplicitDecimal, EuroStyleComma, TruncatedDecimal, ImpliedCents };

struct MoneyToken {
  Cents value = 0;
  std::string rawText;
  int offset = 0;
  MoneyEncoding encoding = MoneyEncoding::ExplicitDecimal;
};

template <typename T>
struct FieldResult {
  std::optional<T> value;
  double confidence = 0.0;  // 0..100
  std::string reasoning;
  std::optional<std::string> provenance;
};

enum class CategorySource { Rules, Engine };

struct CategoryResult {
  std::optional<std::string> category;
  double confidence = 0.0;  // 0..1
  std::string reasoning;
  CategorySource source = CategorySource::Rules;
};

// Caller-supplied context used by categorization and the sales-tax state rule.
struct BusinessContext {
  std::string explanation;
  std::string businessType;
  std::string businessState;
};

struct ExtractionRecord {
  OcrResult ocr;
  FieldResult<std::string> vendor;
  FieldResult<std::string> date;  // ISO-8601 (YYYY-MM-DD)
  FieldResult<Cents> tax;
  FieldResult<Cents> total;
  CategoryResult category;
  std::vector<std::string> flags;
  bool needsReview = false;
};

// "45.12" style rendering of a cents amount.
std::string formatCents(Cents amount);

const char* toString(OcrStatus status);
const char* toString(MoneyEncoding encoding);
const char* toString(CategorySource source);

OcrStatus statusFromConfidence(double confidence);

double clamp01(double x);

// Maps a 0..1 score to a 0..100 confidence rounded to one decimal.
double toConfidence100(double score);
