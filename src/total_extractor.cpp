#include "total_extractor.hpp"

#include "logging.hpp"
#include "money.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <set>
#include <string>
#include <vector>

namespace {

const std::vector<std::regex>& strongLabels() {
  static const std::vector<std::regex> res = {
    std::regex(R"(grand\s*total)"), std::regex(R"(total\s+due)"), std::regex(R"(amount\s+due)"),
    std::regex(R"(balance\s+due)"), std::regex(R"(amount\s+payable)"), std::regex(R"(pay\s+this\s+amount)"),
    std::regex(R"(order\s*total)"),
  };
  return res;
}

const std::regex kWeakLabelRe(R"(\btotal\b)");
const std::regex kItemMathRe(R"(\b\d{1,9}\s{0,3}(?:x|@)\s{0,3}\$?\s{0,3}\d{1,9}(\.\d{1,2})?\b)");

const std::vector<std::string> kBadContext = {
  "subtotal", "sub total", "item total", "items total", "line total", "extended", "ext price", "extension",
  "merchandise", "merch total", "taxable", "vat", "tip", "gratuity", "tender", "cash", "change",
  "amount tendered", "payment", "debit", "credit", "card", "visa", "mastercard", "auth", "approval",
  "discount", "savings", "refund",
};

bool hasStrongLabel(const std::string& lo) {
  for (const auto& re : strongLabels()) {
    if (std::regex_search(lo, re)) return true;
  }
  return false;
}

bool isItemMath(const std::string& lo) {
  return std::regex_search(lo, kItemMathRe);
}

bool isBadContext(const std::string& lo) {
  if (hasStrongLabel(lo)) return false;
  return containsAny(lo, kBadContext) || isItemMath(lo);
}

struct Candidate {
  Cents value;
  double score;
  std::string reason;
};

class TotalScorer {
public:
  TotalScorer(const ScoringConstants& sc, const std::optional<Cents>& tax) : sc_(sc), tax_(tax) {}

  // Returns the clamped score; explanations are appended to `why`.
  double score(Cents value, const std::string& context, bool labeled, std::vector<std::string>& why) const {
    double s = labeled ? sc_.totalLabeledBase : sc_.totalUnlabeledBase;
    why.push_back(labeled ? "Labeled total window" : "Unlabeled candidate");

    std::string lo = toLower(context);
    if (isBadContext(lo)) {
      s -= sc_.totalBadContextPenalty;
      why.push_back("Penalized: bad context");
    }
    if (lo.find("tax") != std::string::npos || lo.find("vat") != std::string::npos) {
      s -= sc_.totalTaxContextPenalty;
      why.push_back("Penalized: tax context");
    }
    if (value < sc_.totalSmallCents) {
      s -= sc_.totalSmallPenalty;
      why.push_back("Penalized: too small");
    } else if (value > sc_.totalLargeCents) {
      s -= sc_.totalLargePenalty;
      why.push_back("Penalized: unusually large");
    }
    if (tax_ && std::llabs(value - *tax_) <= sc_.totalMatchesTaxToleranceCents) {
      s -= sc_.totalMatchesTaxPenalty;
      why.push_back("Penalized: matches tax value");
    }
    // values are held in whole cents, so every candidate is currency-precise
    s += sc_.totalPrecisionBump;
    why.push_back("Bump: currency-like precision");
    return clamp01(s);
  }

private:
  const ScoringConstants& sc_;
  std::optional<Cents> tax_;
};

std::string describe(const std::vector<std::string>& why, const std::string& source) {
  std::string out;
  for (size_t i = 0; i < why.size(); ++i) {
    if (i) out += " ; ";
    out += why[i];
  }
  return out + ". Source: '" + source + "'";
}

const Candidate* pickBest(const std::vector<Candidate>& candidates) {
  const Candidate* best = nullptr;
  for (const auto& c : candidates) {
    if (!best || c.score > best->score) best = &c;
  }
  return best;
}

std::vector<Cents> moneyValues(const std::string& text, MoneyMode mode, const ScoringConstants& sc) {
  std::vector<Cents> out;
  for (const auto& t : extractMoneyTokens(text, mode, sc)) out.push_back(t.value);
  return out;
}

} // namespace

FieldResult<Cents> extractTotal(const SectionedText& text, const ExtractorConfig& config,
                                const std::optional<Cents>& tax) {
  const ScoringConstants& sc = config.scoring;
  FieldResult<Cents> result;

  std::vector<std::string> lines;
  std::set<std::string> seen;
  for (const auto& line : text.full()) {
    if (seen.insert(line).second) lines.push_back(line);
  }
  if (lines.empty()) {
    result.reasoning = "No OCR text.";
    return result;
  }

  TotalScorer scorer(sc, tax);
  auto finish = [&](const std::vector<Candidate>& candidates, const char* provenance) {
    const Candidate* best = pickBest(candidates);
    result.value = best->value;
    result.confidence = std::round(best->score * 10000.0) / 100.0;
    result.reasoning = best->reason;
    result.provenance = provenance;
    logger()->debug("total: {} ({}) {}", formatCents(best->value), result.confidence, best->reason);
    return result;
  };

  // strong labels: value on the label line, else the label line plus the next two
  std::vector<Candidate> candidates;
  bool sameLine = false;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string lo = toLower(lines[i]);
    if (!hasStrongLabel(lo)) continue;

    auto lineValues = moneyValues(lines[i], MoneyMode::Labeled, sc);
    if (!lineValues.empty()) {
      std::vector<std::string> why;
      Cents v = lineValues.back();
      double s = std::min(1.0, scorer.score(v, lines[i], true, why) + sc.totalStrongSameLineBump);
      why.push_back("Strong label match (same line)");
      candidates.push_back({v, s, describe(why, lines[i])});
      sameLine = true;
      continue;
    }

    std::string window = joinLines(lines, " | ", i, i + 3);
    for (Cents v : moneyValues(window, MoneyMode::Labeled, sc)) {
      std::vector<std::string> why;
      double s = std::min(1.0, scorer.score(v, window, true, why) + sc.totalStrongWindowBump);
      why.push_back("Strong label match");
      candidates.push_back({v, s, describe(why, window)});
    }
  }
  if (!candidates.empty()) return finish(candidates, sameLine ? "strong_label" : "strong_label_window");

  for (size_t i = 0; i < lines.size(); ++i) {
    std::string lo = toLower(lines[i]);
    if (!std::regex_search(lo, kWeakLabelRe) || isBadContext(lo)) continue;
    std::string window = joinLines(lines, " | ", i, i + 3);
    for (Cents v : moneyValues(window, MoneyMode::Labeled, sc)) {
      std::vector<std::string> why;
      double s = std::min(1.0, scorer.score(v, window, true, why) + sc.totalWeakBump);
      why.push_back("Weak label match");
      candidates.push_back({v, s, describe(why, window)});
    }
  }
  if (!candidates.empty()) return finish(candidates, "weak_label_window");

  for (const auto& line : lines) {
    if (isBadContext(toLower(line))) continue;
    for (Cents v : moneyValues(line, MoneyMode::Unlabeled, sc)) {
      std::vector<std::string> why;
      double s = scorer.score(v, line, false, why);
      candidates.push_back({v, s, describe(why, line)});
    }
  }
  if (!candidates.empty()) return finish(candidates, "global_fallback");

  for (const auto& line : lines) {
    if (isItemMath(toLower(line))) continue;
    for (Cents v : moneyValues(line, MoneyMode::Unlabeled, sc)) {
      std::vector<std::string> why;
      double s = std::max(0.0, scorer.score(v, line, false, why) - sc.totalLoosenedPenalty);
      why.push_back("Loosened context filter");
      candidates.push_back({v, s, describe(why, line)});
    }
  }
  if (!candidates.empty()) return finish(candidates, "loosened_fallback");

  result.reasoning = "No money candidates found.";
  return result;
}
