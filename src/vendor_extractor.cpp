#include "vendor_extractor.hpp"

#include "logging.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <regex>
#include <vector>

namespace {

const std::vector<std::string> kNonVendorLabels = {
  "total", "sale total", "grand total", "invoice total", "total due", "order total",
  "sales tax", "tax", "vat", "gst", "hst",
  "date", "dated", "txn date", "trans date", "transaction date", "purchase date", "issued", "invoice date",
  "subtotal", "sub total",
};

const std::vector<std::string> kAddressMarkers = {
  "street", " st ", " st.", "road", " rd", " rd.", "ave", "suite", "phone", "tel", "www", ".com", "@",
};

// Label only; the vendor name is the rest of the line after the match.
const std::regex kLabeledVendorRe(R"(\b(from|sold by|merchant|seller)\s{0,3}[:\-]\s{0,3})", std::regex::icase);
const std::regex kMerchantRe(R"(\bmerchant\b\s{1,3})", std::regex::icase);
const std::regex kTokenRe(R"([a-z0-9']{3,40})");

std::string escapeRegex(const std::string& s) {
  static const std::string special = R"(\^$.|?*+()[]{})";
  std::string out;
  for (char ch : s) {
    if (special.find(ch) != std::string::npos) out.push_back('\\');
    out.push_back(ch);
  }
  return out;
}

struct SearchSpace {
  std::string name;
  double bump;
  std::string hay;  // lower-case
};

struct VendorMatch {
  std::string canonical;
  std::string alias;
  std::string provenance;
  double score = 0.0;
};

double heuristicLineScore(const std::string& line) {
  int alpha = countAlpha(line);
  int digit = countDigits(line);
  double score = 0.0;
  if (alpha >= 4) score += 0.30;
  if (digit > alpha) score -= 0.20;
  int upper = static_cast<int>(std::count_if(line.begin(), line.end(), [](unsigned char c) {
    return std::isupper(c) != 0;
  }));
  if (alpha > 0 && static_cast<double>(upper) / alpha >= 0.60) score += 0.12;

  size_t words = 0;
  bool inWord = false;
  for (char ch : line) {
    bool space = std::isspace(static_cast<unsigned char>(ch)) != 0;
    if (!space && !inWord) words++;
    inWord = !space;
  }
  if (words >= 1 && words <= 4) score += 0.10;
  return clamp01(score);
}

} // namespace

bool vendorAliasHit(const std::string& alias, const std::string& haystack) {
  std::string a = toLower(trim(alias));
  std::string h = toLower(haystack);
  if (a.empty() || h.empty()) return false;

  std::string aN = alnumOnly(a);
  if (aN.size() < 4) {
    std::regex word("(^|[^a-z0-9])" + escapeRegex(a) + "($|[^a-z0-9])");
    return std::regex_search(h, word);
  }

  if (h.find(a) != std::string::npos) return true;
  if (alnumOnly(h).find(aN) != std::string::npos) return true;

  // truncated or smeared names: "autozz" -> "autozone"
  std::string a4 = aN.substr(0, 4);
  for (auto it = std::sregex_iterator(h.begin(), h.end(), kTokenRe); it != std::sregex_iterator(); ++it) {
    std::string tN = alnumOnly(it->str());
    if (tN.size() <= a4.size()) continue;
    if (tN.compare(0, a4.size(), a4) != 0) continue;
    if (std::abs(static_cast<int>(tN.size()) - static_cast<int>(aN.size())) <= 4) return true;
  }
  return false;
}

FieldResult<std::string> extractVendor(const SectionedText& text, const ExtractorConfig& config) {
  const ScoringConstants& sc = config.scoring;
  const auto& lines = text.full();
  FieldResult<std::string> result;
  if (lines.empty()) {
    result.reasoning = "No OCR lines.";
    return result;
  }

  size_t topCount = std::min(lines.size(), static_cast<size_t>(sc.vendorTopLines));

  std::vector<SearchSpace> spaces;
  if (!text.section(kSectionVendor).empty()) {
    spaces.push_back({kSectionVendor, sc.vendorPassBump, toLower(joinLines(text.section(kSectionVendor), "\n"))});
  }
  if (!text.section(kSectionSoftText).empty()) {
    spaces.push_back({kSectionSoftText, sc.vendorSoftPassBump,
                      toLower(joinLines(text.section(kSectionSoftText), "\n"))});
  }
  spaces.push_back({"top_full", sc.vendorTopLinesBump, toLower(joinLines(lines, "\n", 0, topCount))});
  spaces.push_back({kSectionFull, 0.0, toLower(joinLines(lines, "\n"))});

  VendorMatch best;
  for (const auto& space : spaces) {
    for (const auto& entry : config.tables.vendorAliases) {
      for (const auto& alias : entry.aliases) {
        if (!vendorAliasHit(alias, space.hay)) continue;
        double score = sc.vendorAliasBase + space.bump;
        if (space.hay.find(toLower(entry.canonical)) != std::string::npos) score += sc.vendorCanonicalBump;
        score = clamp01(score);
        if (score > best.score) {
          best = {entry.canonical, alias, "alias_match:" + space.name, score};
        }
      }
    }
    bool highTrust = space.name == kSectionVendor || space.name == kSectionSoftText;
    if (!best.canonical.empty() && best.score >= sc.vendorEarlyExitScore && highTrust) break;
  }

  if (!best.canonical.empty()) {
    result.value = best.canonical;
    result.confidence = toConfidence100(best.score);
    result.reasoning = "Matched vendor alias '" + best.alias + "' in " + best.provenance + ".";
    result.provenance = best.provenance;
    logger()->debug("vendor: {} ({}) {}", best.canonical, result.confidence, result.reasoning);
    return result;
  }

  size_t labeledCount = std::min(lines.size(), static_cast<size_t>(sc.vendorLabeledLines));
  for (size_t i = 0; i < labeledCount; ++i) {
    for (const std::regex* re : {&kLabeledVendorRe, &kMerchantRe}) {
      std::smatch m;
      if (!std::regex_search(lines[i], m, *re)) continue;
      std::string candidate = collapseSpaces(stripNoise(m.suffix().str()));
      if (candidate.size() < 2 || candidate.size() > 50) continue;
      result.value = candidate;
      result.confidence = toConfidence100(sc.vendorLabeledScore);
      result.reasoning = "Found vendor in labeled line: '" + lines[i] + "'.";
      result.provenance = "labeled_vendor";
      logger()->debug("vendor: {} ({}) {}", candidate, result.confidence, result.reasoning);
      return result;
    }
  }

  std::string bestLine;
  double bestLineScore = 0.0;
  for (size_t i = 0; i < topCount; ++i) {
    const std::string& line = lines[i];
    std::string lo = toLower(line);
    if (containsAny(lo, kNonVendorLabels) || containsAny(lo, kAddressMarkers)) continue;
    if (line.size() < 3 || line.size() > 55) continue;
    double score = heuristicLineScore(line);
    if (score > bestLineScore && !collapseSpaces(stripNoise(line)).empty()) {
      bestLineScore = score;
      bestLine = line;
    }
  }

  if (!bestLine.empty()) {
    result.value = collapseSpaces(stripNoise(bestLine));
    result.confidence = toConfidence100(sc.vendorHeuristicFloor + bestLineScore * sc.vendorHeuristicScale);
    result.reasoning = "Fallback vendor guess from early merchant-like line: '" + bestLine + "'.";
    result.provenance = "heuristic_top_line";
    logger()->debug("vendor: {} ({}) {}", *result.value, result.confidence, result.reasoning);
    return result;
  }

  result.reasoning = "No reliable vendor signal found.";
  return result;
}
