#pragma once

#include <string>
#include <utility>
#include <vector>

#include "receipt_types.hpp"

// Empirically tuned scores and thresholds. Scores are on a 0..1 scale,
// confidence thresholds on 0..100, money thresholds in cents.
struct ScoringConstants {
  // money tokens
  Cents moneyMaxCents = 5000000;
  Cents moneyMaxIntegerCents = 1000000;

  // vendor
  double vendorAliasBase = 0.84;
  double vendorPassBump = 0.10;
  double vendorSoftPassBump = 0.06;
  double vendorTopLinesBump = 0.04;
  double vendorCanonicalBump = 0.03;
  double vendorEarlyExitScore = 0.92;
  double vendorLabeledScore = 0.68;
  double vendorHeuristicFloor = 0.30;
  double vendorHeuristicScale = 0.30;
  int vendorTopLines = 14;
  int vendorLabeledLines = 20;

  // date
  double dateLabelScore = 0.86;
  double dateNumericPassScore = 0.74;
  double dateTopLinesScore = 0.70;
  double dateFullScore = 0.62;
  double dateFuturePenalty = 0.35;
  double dateOldPenalty = 0.15;
  double dateRecentBump = 0.04;
  int dateFutureYears = 2;
  int dateOldYears = 15;
  int dateRecentYears = 2;
  int dateLabelLines = 40;
  int dateTopLines = 35;
  int dateWindowRadius = 3;

  // tax
  double taxStrongScore = 0.85;
  double taxMediumScore = 0.70;
  double taxTotalsPassBump = 0.08;
  double taxCurrencyBump = 0.03;
  double taxTinyPenalty = 0.50;
  double taxLargePenalty = 0.25;
  double taxExceedsTotalPenalty = 0.60;
  double taxInferredScore = 0.70;
  double taxInferredTotalsBump = 0.05;
  double taxInferredMaxRate = 0.25;
  Cents taxTinyCents = 1;
  Cents taxLargeCents = 50000;

  // total
  double totalLabeledBase = 0.90;
  double totalUnlabeledBase = 0.55;
  double totalBadContextPenalty = 0.35;
  double totalTaxContextPenalty = 0.30;
  double totalSmallPenalty = 0.25;
  double totalLargePenalty = 0.20;
  double totalMatchesTaxPenalty = 0.35;
  double totalPrecisionBump = 0.03;
  double totalStrongSameLineBump = 0.10;
  double totalStrongWindowBump = 0.05;
  double totalWeakBump = 0.03;
  double totalLoosenedPenalty = 0.05;
  Cents totalSmallCents = 100;
  Cents totalLargeCents = 2000000;
  Cents totalMatchesTaxToleranceCents = 2;

  // category
  double categoryHintConfidence = 0.90;
  double categoryVendorConfidence = 0.95;
  double categoryKeywordConfidence = 0.80;
  double categoryBusinessDefaultConfidence = 0.55;
  double categoryEngineExplanationConfidence = 0.85;
  double categoryEngineOcrConfidence = 0.70;
  double categoryEngineVendorConfidence = 0.60;

  // review gate
  double reviewTotalMinConfidence = 80.0;
  double reviewDateMinConfidence = 70.0;
  double reviewVendorMinConfidence = 70.0;
  double reviewMaxTaxRate = 0.25;
};

struct OcrSettings {
  std::string language = "eng";
  std::string tessdataPath;  // empty: engine default
  int dpi = 300;
  int maxPdfPages = 10;
  double earlyExitScore = 0.86;
  int pdfTextMinChars = 40;
  double pdfTextConfidence = 95.0;
  double topStripFraction = 0.32;
  double rightStripFraction = 0.42;
};

struct VendorAlias {
  std::string canonical;
  std::vector<std::string> aliases;
};

struct CategoryKeywords {
  std::string category;
  std::vector<std::string> keywords;
};

struct BusinessTypeHint {
  std::string businessType;
  std::vector<CategoryKeywords> categories;
};

using KeyCategoryTable = std::vector<std::pair<std::string, std::string>>;

// Lookup tables keep insertion order; iteration order breaks ties.
struct ReferenceTables {
  std::vector<VendorAlias> vendorAliases;
  KeyCategoryTable vendorCategories;
  KeyCategoryTable keywordCategories;
  KeyCategoryTable businessTypeDefaults;
  std::vector<BusinessTypeHint> businessTypeHints;
  std::vector<CategoryKeywords> engineKeywords;
  std::vector<std::string> noSalesTaxStates;
};

struct ExtractorConfig {
  ScoringConstants scoring;
  OcrSettings ocr;
  ReferenceTables tables;
};

ReferenceTables defaultReferenceTables();

ExtractorConfig defaultExtractorConfig();

// Defaults overridden by a YAML document with optional `scoring:`, `ocr:`
// and `tables:` maps. Throws std::runtime_error on malformed input.
ExtractorConfig parseExtractorConfig(const std::string& yamlText);
ExtractorConfig loadExtractorConfig(const std::string& path);
