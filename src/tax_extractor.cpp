#include "tax_extractor.hpp"

#include "logging.hpp"
#include "money.hpp"
#include "text_utils.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

const std::vector<std::string> kStrongTaxLabels = {
  "sales tax", "estimated tax", "tax to be collected", "tax collected", "tax amount",
  "vat", "gst", "pst", "hst", "qst", "iva", "mwst", "tva",
};

const std::vector<std::string> kMediumTaxLabels = {"tax:", " tax ", "tax "};

// Mentions of tax that never carry the tax amount.
const std::vector<std::string> kTaxTraps = {
  "before tax", "total before tax", "pre-tax", "pretax", "taxable", "tax rate", "tax %",
  "tax percent", "% tax", "tax id", "tax no", "tax number", "tax invoice",
};

const std::vector<std::string> kSubtotalLabels = {
  "subtotal", "sub total", "total before tax", "before tax total", "pre-tax total", "pretax total",
  "merchandise", "items subtotal",
};

const std::vector<std::string> kGrandTotalLabels = {
  "grand total", "order total", "amount due", "balance due", "total:", "total $", "total ",
};

const std::vector<std::string> kNotGrandTotal = {
  "item total", "items total", "item(s) total", "subtotal", "sub total", "total before tax", "pretax",
  "pre tax", "before tax", "tax", "sales tax", "vat", "gst", "hst", "discount", "coupon", "savings",
  "change", "cash", "tender", "payment", "paid", "balance", "amount due", "tip", "gratuity",
  "shipping", "handling", "deposit", "auth", "authorization",
};

const std::vector<std::string> kDefinitelyGrandTotal = {
  "grand total", "order total", "total due", "amount due", "balance due", "total:",
};

bool isBadTotalContext(const std::string& lo) {
  if (containsAny(lo, kDefinitelyGrandTotal)) return false;
  return containsAny(lo, kNotGrandTotal);
}

std::optional<Cents> lastMoney(const std::string& line, const ScoringConstants& sc) {
  auto tokens = extractMoneyTokens(line, MoneyMode::Labeled, sc);
  if (tokens.empty()) return std::nullopt;
  return tokens.back().value;
}

struct SeenAmount {
  Cents value = 0;
  std::string source;
  bool fromTotals = false;
};

} // namespace

FieldResult<Cents> extractTax(const SectionedText& text, const ExtractorConfig& config) {
  const ScoringConstants& sc = config.scoring;
  FieldResult<Cents> result;
  if (text.full().empty()) {
    result.reasoning = "No OCR text.";
    return result;
  }

  std::vector<std::pair<std::string, const std::string*>> scan;
  for (const auto& line : text.section(kSectionTotals)) scan.emplace_back(kSectionTotals, &line);
  for (const auto& line : text.full()) scan.emplace_back(kSectionFull, &line);

  std::optional<Cents> bestValue;
  double bestScore = 0.0;
  std::string bestReason;
  std::string bestSource;
  std::optional<SeenAmount> subtotal;
  std::optional<SeenAmount> total;

  for (const auto& [src, linePtr] : scan) {
    const std::string& line = *linePtr;
    std::string lo = toLower(line);
    std::string where = src + ": '" + line + "'";

    if (!subtotal && containsAny(lo, kSubtotalLabels)) {
      if (auto v = lastMoney(line, sc)) subtotal = SeenAmount{*v, where, src == kSectionTotals};
    }
    if (!total && containsAny(lo, kGrandTotalLabels) && !isBadTotalContext(lo)) {
      if (auto v = lastMoney(line, sc)) total = SeenAmount{*v, where, src == kSectionTotals};
    }

    if (containsAny(lo, kTaxTraps)) continue;
    bool strong = containsAny(lo, kStrongTaxLabels);
    bool medium = !strong && containsAny(lo, kMediumTaxLabels);
    if (!strong && !medium) continue;

    auto v = lastMoney(line, sc);
    if (!v) continue;

    double score = strong ? sc.taxStrongScore : sc.taxMediumScore;
    if (src == kSectionTotals) score += sc.taxTotalsPassBump;
    if (line.find('$') != std::string::npos) score += sc.taxCurrencyBump;
    if (*v < sc.taxTinyCents) score -= sc.taxTinyPenalty;
    if (*v > sc.taxLargeCents) score -= sc.taxLargePenalty;
    if (total && *v > total->value) score -= sc.taxExceedsTotalPenalty;
    score = clamp01(score);

    if (score > bestScore) {
      bestScore = score;
      bestValue = v;
      bestSource = src;
      bestReason = std::string("Matched ") + (strong ? "strong" : "medium") + " tax label; Source: (" + src + ") '" +
                   line + "'";
    }
  }

  if (bestValue) {
    result.value = bestValue;
    result.confidence = toConfidence100(bestScore);
    result.reasoning = bestReason;
    result.provenance = "tax_label:" + bestSource;
    logger()->debug("tax: {} ({}) {}", formatCents(*bestValue), result.confidence, bestReason);
    return result;
  }

  if (total && subtotal) {
    Cents inferred = total->value - subtotal->value;
    if (inferred >= 0 && total->value > 0 &&
        static_cast<double>(inferred) / static_cast<double>(total->value) <= sc.taxInferredMaxRate) {
      double score = sc.taxInferredScore;
      if (total->fromTotals && subtotal->fromTotals) score += sc.taxInferredTotalsBump;
      result.value = inferred;
      result.confidence = toConfidence100(score);
      result.reasoning = "Inferred tax = total - subtotal (" + formatCents(total->value) + " - " +
                         formatCents(subtotal->value) + "). Total from " + total->source + "; subtotal from " +
                         subtotal->source;
      result.provenance = "inferred_total_minus_subtotal";
      logger()->debug("tax: {} ({}) {}", formatCents(inferred), result.confidence, result.reasoning);
      return result;
    }
  }

  result.reasoning = "No tax line detected.";
  return result;
}
