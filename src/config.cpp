#include "config.hpp"

#include <stdexcept>
#include <string>

#include <yaml-cpp/yaml.h>

namespace {

struct DoubleKey {
  const char* key;
  double ScoringConstants::*field;
};

struct IntKey {
  const char* key;
  int ScoringConstants::*field;
};

struct CentsKey {
  const char* key;
  Cents ScoringConstants::*field;
};

const DoubleKey kDoubleKeys[] = {
  {"vendor_alias_base", &ScoringConstants::vendorAliasBase},
  {"vendor_pass_bump", &ScoringConstants::vendorPassBump},
  {"vendor_soft_pass_bump", &ScoringConstants::vendorSoftPassBump},
  {"vendor_top_lines_bump", &ScoringConstants::vendorTopLinesBump},
  {"vendor_canonical_bump", &ScoringConstants::vendorCanonicalBump},
  {"vendor_early_exit_score", &ScoringConstants::vendorEarlyExitScore},
  {"vendor_labeled_score", &ScoringConstants::vendorLabeledScore},
  {"vendor_heuristic_floor", &ScoringConstants::vendorHeuristicFloor},
  {"vendor_heuristic_scale", &ScoringConstants::vendorHeuristicScale},
  {"date_label_score", &ScoringConstants::dateLabelScore},
  {"date_numeric_pass_score", &ScoringConstants::dateNumericPassScore},
  {"date_top_lines_score", &ScoringConstants::dateTopLinesScore},
  {"date_full_score", &ScoringConstants::dateFullScore},
  {"date_future_penalty", &ScoringConstants::dateFuturePenalty},
  {"date_old_penalty", &ScoringConstants::dateOldPenalty},
  {"date_recent_bump", &ScoringConstants::dateRecentBump},
  {"tax_strong_score", &ScoringConstants::taxStrongScore},
  {"tax_medium_score", &ScoringConstants::taxMediumScore},
  {"tax_totals_pass_bump", &ScoringConstants::taxTotalsPassBump},
  {"tax_currency_bump", &ScoringConstants::taxCurrencyBump},
  {"tax_tiny_penalty", &ScoringConstants::taxTinyPenalty},
  {"tax_large_penalty", &ScoringConstants::taxLargePenalty},
  {"tax_exceeds_total_penalty", &ScoringConstants::taxExceedsTotalPenalty},
  {"tax_inferred_score", &ScoringConstants::taxInferredScore},
  {"tax_inferred_totals_bump", &ScoringConstants::taxInferredTotalsBump},
  {"tax_inferred_max_rate", &ScoringConstants::taxInferredMaxRate},
  {"total_labeled_base", &ScoringConstants::totalLabeledBase},
  {"total_unlabeled_base", &ScoringConstants::totalUnlabeledBase},
  {"total_bad_context_penalty", &ScoringConstants::totalBadContextPenalty},
  {"total_tax_context_penalty", &ScoringConstants::totalTaxContextPenalty},
  {"total_small_penalty", &ScoringConstants::totalSmallPenalty},
  {"total_large_penalty", &ScoringConstants::totalLargePenalty},
  {"total_matches_tax_penalty", &ScoringConstants::totalMatchesTaxPenalty},
  {"total_precision_bump", &ScoringConstants::totalPrecisionBump},
  {"total_strong_same_line_bump", &ScoringConstants::totalStrongSameLineBump},
  {"total_strong_window_bump", &ScoringConstants::totalStrongWindowBump},
  {"total_weak_bump", &ScoringConstants::totalWeakBump},
  {"total_loosened_penalty", &ScoringConstants::totalLoosenedPenalty},
  {"category_hint_confidence", &ScoringConstants::categoryHintConfidence},
  {"category_vendor_confidence", &ScoringConstants::categoryVendorConfidence},
  {"category_keyword_confidence", &ScoringConstants::categoryKeywordConfidence},
  {"category_business_default_confidence", &ScoringConstants::categoryBusinessDefaultConfidence},
  {"category_engine_explanation_confidence", &ScoringConstants::categoryEngineExplanationConfidence},
  {"category_engine_ocr_confidence", &ScoringConstants::categoryEngineOcrConfidence},
  {"category_engine_vendor_confidence", &ScoringConstants::categoryEngineVendorConfidence},
  {"review_total_min_confidence", &ScoringConstants::reviewTotalMinConfidence},
  {"review_date_min_confidence", &ScoringConstants::reviewDateMinConfidence},
  {"review_vendor_min_confidence", &ScoringConstants::reviewVendorMinConfidence},
  {"review_max_tax_rate", &ScoringConstants::reviewMaxTaxRate},
};

const IntKey kIntKeys[] = {
  {"vendor_top_lines", &ScoringConstants::vendorTopLines},
  {"vendor_labeled_lines", &ScoringConstants::vendorLabeledLines},
  {"date_future_years", &ScoringConstants::dateFutureYears},
  {"date_old_years", &ScoringConstants::dateOldYears},
  {"date_recent_years", &ScoringConstants::dateRecentYears},
  {"date_label_lines", &ScoringConstants::dateLabelLines},
  {"date_top_lines", &ScoringConstants::dateTopLines},
  {"date_window_radius", &ScoringConstants::dateWindowRadius},
};

const CentsKey kCentsKeys[] = {
  {"money_max_cents", &ScoringConstants::moneyMaxCents},
  {"money_max_integer_cents", &ScoringConstants::moneyMaxIntegerCents},
  {"tax_tiny_cents", &ScoringConstants::taxTinyCents},
  {"tax_large_cents", &ScoringConstants::taxLargeCents},
  {"total_small_cents", &ScoringConstants::totalSmallCents},
  {"total_large_cents", &ScoringConstants::totalLargeCents},
  {"total_matches_tax_tolerance_cents", &ScoringConstants::totalMatchesTaxToleranceCents},
};

void applyScoring(const YAML::Node& node, ScoringConstants& scoring) {
  if (!node) return;
  if (!node.IsMap()) throw std::runtime_error("'scoring' must be a map");
  for (const auto& k : kDoubleKeys) {
    if (node[k.key]) scoring.*(k.field) = node[k.key].as<double>();
  }
  for (const auto& k : kIntKeys) {
    if (node[k.key]) scoring.*(k.field) = node[k.key].as<int>();
  }
  for (const auto& k : kCentsKeys) {
    if (node[k.key]) scoring.*(k.field) = node[k.key].as<Cents>();
  }
}

void applyOcr(const YAML::Node& node, OcrSettings& ocr) {
  if (!node) return;
  if (!node.IsMap()) throw std::runtime_error("'ocr' must be a map");
  if (node["language"]) ocr.language = node["language"].as<std::string>();
  if (node["tessdata_path"]) ocr.tessdataPath = node["tessdata_path"].as<std::string>();
  if (node["dpi"]) ocr.dpi = node["dpi"].as<int>();
  if (node["max_pdf_pages"]) ocr.maxPdfPages = node["max_pdf_pages"].as<int>();
  if (node["early_exit_score"]) ocr.earlyExitScore = node["early_exit_score"].as<double>();
  if (node["pdf_text_min_chars"]) ocr.pdfTextMinChars = node["pdf_text_min_chars"].as<int>();
  if (node["pdf_text_confidence"]) ocr.pdfTextConfidence = node["pdf_text_confidence"].as<double>();
  if (node["top_strip_fraction"]) ocr.topStripFraction = node["top_strip_fraction"].as<double>();
  if (node["right_strip_fraction"]) ocr.rightStripFraction = node["right_strip_fraction"].as<double>();
  if (ocr.maxPdfPages < 1) throw std::runtime_error("ocr.max_pdf_pages must be positive");
}

// YAML maps are unordered in the document model; sequences of single-key
// maps keep the order that tie-breaking depends on.
KeyCategoryTable readKeyCategoryTable(const YAML::Node& node, const char* name) {
  KeyCategoryTable out;
  if (node.IsMap()) {
    for (const auto& kv : node) {
      out.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>());
    }
    return out;
  }
  if (!node.IsSequence()) throw std::runtime_error(std::string("table '") + name + "' must be a map or a list");
  for (const auto& item : node) {
    if (!item.IsMap() || item.size() != 1) {
      throw std::runtime_error(std::string("table '") + name + "' entries must be single-key maps");
    }
    auto kv = item.begin();
    out.emplace_back(kv->first.as<std::string>(), kv->second.as<std::string>());
  }
  return out;
}

std::vector<CategoryKeywords> readCategoryKeywords(const YAML::Node& node) {
  std::vector<CategoryKeywords> out;
  for (const auto& kv : node) {
    out.push_back(CategoryKeywords{kv.first.as<std::string>(), kv.second.as<std::vector<std::string>>()});
  }
  return out;
}

void applyTables(const YAML::Node& node, ReferenceTables& tables) {
  if (!node) return;
  if (!node.IsMap()) throw std::runtime_error("'tables' must be a map");

  if (const auto n = node["vendor_aliases"]) {
    tables.vendorAliases.clear();
    for (const auto& kv : n) {
      tables.vendorAliases.push_back(VendorAlias{kv.first.as<std::string>(), kv.second.as<std::vector<std::string>>()});
    }
  }
  if (const auto n = node["vendor_categories"]) tables.vendorCategories = readKeyCategoryTable(n, "vendor_categories");
  if (const auto n = node["keyword_categories"]) tables.keywordCategories = readKeyCategoryTable(n, "keyword_categories");
  if (const auto n = node["business_type_defaults"]) tables.businessTypeDefaults = readKeyCategoryTable(n, "business_type_defaults");
  if (const auto n = node["business_type_hints"]) {
    tables.businessTypeHints.clear();
    for (const auto& kv : n) {
      tables.businessTypeHints.push_back(BusinessTypeHint{kv.first.as<std::string>(), readCategoryKeywords(kv.second)});
    }
  }
  if (const auto n = node["engine_keywords"]) tables.engineKeywords = readCategoryKeywords(n);
  if (const auto n = node["no_sales_tax_states"]) tables.noSalesTaxStates = n.as<std::vector<std::string>>();
}

ExtractorConfig configFromNode(const YAML::Node& root) {
  ExtractorConfig config = defaultExtractorConfig();
  if (!root || root.IsNull()) return config;
  if (!root.IsMap()) throw std::runtime_error("top level must be a map");
  applyScoring(root["scoring"], config.scoring);
  applyOcr(root["ocr"], config.ocr);
  applyTables(root["tables"], config.tables);
  return config;
}

} // namespace

ExtractorConfig defaultExtractorConfig() {
  ExtractorConfig config;
  config.tables = defaultReferenceTables();
  return config;
}

ExtractorConfig parseExtractorConfig(const std::string& yamlText) {
  try {
    return configFromNode(YAML::Load(yamlText));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
  }
}

ExtractorConfig loadExtractorConfig(const std::string& path) {
  try {
    return configFromNode(YAML::LoadFile(path));
  } catch (const YAML::BadFile&) {
    throw std::runtime_error("Cannot read configuration file: " + path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Invalid configuration file " + path + ": " + e.what());
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("Invalid configuration file " + path + ": " + e.what());
  }
}
