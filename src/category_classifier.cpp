#include "category_classifier.hpp"

#include "logging.hpp"
#include "text_utils.hpp"

#include <utility>
#include <vector>

namespace {

std::string norm(const std::string& s) {
  return collapseSpaces(toLower(s));
}

CategoryResult hit(const std::string& category, double confidence, std::string reasoning, CategorySource source) {
  CategoryResult r;
  r.category = category;
  r.confidence = confidence;
  r.reasoning = std::move(reasoning);
  r.source = source;
  return r;
}

std::optional<CategoryResult> matchBusinessHint(const std::string& businessType, const std::string& explanation,
                                                const ExtractorConfig& config) {
  std::string bt = norm(businessType);
  if (bt.empty() || explanation.empty()) return std::nullopt;
  for (const auto& hint : config.tables.businessTypeHints) {
    if (norm(hint.businessType) != bt) continue;
    for (const auto& group : hint.categories) {
      for (const auto& kw : group.keywords) {
        if (explanation.find(norm(kw)) == std::string::npos) continue;
        return hit(group.category, config.scoring.categoryHintConfidence,
                   "Matched business_type='" + businessType + "' hint in explanation", CategorySource::Engine);
      }
    }
  }
  return std::nullopt;
}

// Longest matching key wins; equal lengths keep table order.
std::optional<CategoryResult> matchVendor(const std::string& vendor, const ExtractorConfig& config) {
  std::string v = norm(vendor);
  if (v.empty()) return std::nullopt;
  const std::pair<std::string, std::string>* best = nullptr;
  size_t bestLen = 0;
  for (const auto& entry : config.tables.vendorCategories) {
    std::string key = norm(entry.first);
    if (key.empty() || v.find(key) == std::string::npos) continue;
    if (key.size() > bestLen) {
      bestLen = key.size();
      best = &entry;
    }
  }
  if (!best) return std::nullopt;
  return hit(best->second, config.scoring.categoryVendorConfidence,
             "Vendor mapping matched: '" + best->first + "' in '" + vendor + "'", CategorySource::Rules);
}

std::optional<CategoryResult> matchKeyword(const std::string& text, const char* scope, const ExtractorConfig& config) {
  if (text.empty()) return std::nullopt;
  for (const auto& [keyword, category] : config.tables.keywordCategories) {
    std::string kw = norm(keyword);
    if (kw.empty() || text.find(kw) == std::string::npos) continue;
    return hit(category, config.scoring.categoryKeywordConfidence,
               std::string(scope) + " rule: Keyword mapping matched: '" + kw + "'", CategorySource::Rules);
  }
  return std::nullopt;
}

std::optional<CategoryResult> matchBusinessDefault(const std::string& businessType, const ExtractorConfig& config) {
  std::string bt = norm(businessType);
  if (bt.empty()) return std::nullopt;
  for (const auto& [type, category] : config.tables.businessTypeDefaults) {
    if (norm(type) != bt) continue;
    return hit(category, config.scoring.categoryBusinessDefaultConfidence,
               "Business type default used: " + businessType, CategorySource::Rules);
  }
  return std::nullopt;
}

// Category with the most keyword hits; ties keep table order.
std::optional<std::string> bestBucket(const std::string& text, const ExtractorConfig& config) {
  if (text.empty()) return std::nullopt;
  const CategoryKeywords* best = nullptr;
  int bestHits = 0;
  for (const auto& bucket : config.tables.engineKeywords) {
    int hits = 0;
    for (const auto& keyword : bucket.keywords) {
      std::string kw = norm(keyword);
      if (!kw.empty() && text.find(kw) != std::string::npos) hits++;
    }
    if (hits > bestHits) {
      bestHits = hits;
      best = &bucket;
    }
  }
  if (!best) return std::nullopt;
  return best->category;
}

} // namespace

CategoryResult classifyCategory(const std::optional<std::string>& vendor, const std::string& ocrText,
                                const BusinessContext& context, const ExtractorConfig& config) {
  const ScoringConstants& sc = config.scoring;
  std::string explanation = norm(context.explanation);
  std::string ocr = norm(ocrText);
  std::string vendorName = vendor.value_or("");

  std::optional<CategoryResult> result = matchBusinessHint(context.businessType, explanation, config);
  if (!result) result = matchVendor(vendorName, config);
  if (!result) result = matchKeyword(explanation, "Explanation", config);
  if (!result) result = matchKeyword(ocr, "OCR", config);
  if (!result) result = matchBusinessDefault(context.businessType, config);

  if (!result) {
    if (auto cat = bestBucket(explanation, config)) {
      result = hit(*cat, sc.categoryEngineExplanationConfidence,
                   "Matched keywords in explanation (highest priority)", CategorySource::Engine);
    } else if (auto cat = bestBucket(ocr, config)) {
      result = hit(*cat, sc.categoryEngineOcrConfidence, "Matched keywords in OCR text", CategorySource::Engine);
    } else if (auto cat = bestBucket(norm(vendorName), config)) {
      result = hit(*cat, sc.categoryEngineVendorConfidence, "Matched keywords in vendor", CategorySource::Engine);
    }
  }

  if (!result) {
    CategoryResult none;
    none.reasoning = "no category match found";
    none.source = CategorySource::Engine;
    return none;
  }
  logger()->debug("category: {} ({}) {}", *result->category, result->confidence, result->reasoning);
  return *result;
}
