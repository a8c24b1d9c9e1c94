#include "money.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <set>
#include <utility>

namespace {

// Quantifiers stay bounded: libstdc++ regex recursion grows with match length.
const std::regex kExplicitRe(R"((\$)?\s{0,3}((?:\d{1,3}(?:,\d{3}){1,3}|\d{1,9})\.\d{2}))");
const std::regex kEuroRe(R"((\$)?\s{0,3}(\d{1,6},\d{2}))");
const std::regex kTruncatedRe(R"((\$)?\s{0,3}(\d{1,6}\.\d))");
const std::regex kIntegerRe(R"(\d{1,9})");

const std::regex kTwoDecimalRe(R"(\b\d{1,5}\.\d{2}\b)");
const std::regex kPhoneRe(R"(\(\d{3}\)|\d{3}[-\s]\d{3}[-\s]\d{4})");
const std::regex kIdContextRe(
    R"(\b(aid|auth|approval|ref|reference|tran|trans|acct|account|card|visa|mastercard|amex|order))");
const std::regex kMoneyShapeRe(R"(\b\d{1,9}\.\d{2}\b|\b\d{3,6}\b)");

const std::vector<std::string> kReceiptMoneyKeywords = {
  "total", "subtotal", "amount due", "balance due", "tax", "vat", "gst", "hst",
};

bool isDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// True when the number at [begin, end) is a fragment of a longer numeral:
// a digit touches it, or a '.'/',' sits between it and another digit.
bool isGlued(const std::string& text, size_t begin, size_t end) {
  if (begin > 0) {
    char prev = text[begin - 1];
    if (isDigit(prev)) return true;
    if ((prev == '.' || prev == ',') && begin > 1 && isDigit(text[begin - 2])) return true;
  }
  if (end < text.size()) {
    char next = text[end];
    if (isDigit(next)) return true;
    if ((next == '.' || next == ',') && end + 1 < text.size() && isDigit(text[end + 1])) return true;
  }
  return false;
}

// "1,234.5" -> 123450. Separators ',' are thousands unless `comma` is the
// decimal mark.
Cents parseCents(const std::string& num, bool commaDecimal) {
  Cents whole = 0;
  Cents frac = 0;
  int fracDigits = 0;
  bool inFrac = false;
  char decimalMark = commaDecimal ? ',' : '.';
  for (char ch : num) {
    if (ch == decimalMark) {
      inFrac = true;
    } else if (isDigit(ch)) {
      if (inFrac) {
        frac = frac * 10 + (ch - '0');
        fracDigits++;
      } else {
        whole = whole * 10 + (ch - '0');
      }
    }
  }
  if (fracDigits == 1) frac *= 10;
  return whole * 100 + frac;
}

struct Collector {
  const ScoringConstants& scoring;
  std::vector<MoneyToken> tokens;

  void add(Cents value, const std::string& raw, size_t offset, MoneyEncoding encoding) {
    if (value <= 0 || value >= scoring.moneyMaxCents) return;
    if (encoding != MoneyEncoding::ImpliedCents && value % 100 == 0 && value >= scoring.moneyMaxIntegerCents) return;
    MoneyToken t;
    t.value = value;
    t.rawText = trim(raw);
    t.offset = static_cast<int>(offset);
    t.encoding = encoding;
    tokens.push_back(std::move(t));
  }
};

void scanDecimalPass(const std::string& text, const std::regex& re, bool commaDecimal, MoneyEncoding encoding,
                     Collector& out) {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator(); ++it) {
    const std::smatch& m = *it;
    size_t numBegin = static_cast<size_t>(m.position(2));
    size_t numEnd = numBegin + static_cast<size_t>(m.length(2));
    if (isGlued(text, numBegin, numEnd)) continue;
    size_t offset = m[1].matched ? static_cast<size_t>(m.position(1)) : numBegin;
    out.add(parseCents(m[2].str(), commaDecimal), text.substr(offset, numEnd - offset), offset, encoding);
  }
}

bool impliedCentsAllowed(const std::string& text) {
  std::string lo = toLower(text);
  if (!containsAny(lo, kReceiptMoneyKeywords)) return false;
  if (std::regex_search(lo, kIdContextRe)) return false;
  if (lo.find("invoice #") != std::string::npos || lo.find("inv#") != std::string::npos) return false;
  // an explicit amount already present makes bare integers untrustworthy
  if (std::regex_search(text, kTwoDecimalRe)) return false;
  return true;
}

bool insidePhoneNumber(const std::string& text, size_t begin, size_t end) {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kPhoneRe); it != std::sregex_iterator(); ++it) {
    size_t pb = static_cast<size_t>(it->position());
    size_t pe = pb + static_cast<size_t>(it->length());
    if (begin < pe && pb < end) return true;
  }
  return false;
}

void scanImpliedCents(const std::string& text, Collector& out) {
  for (auto it = std::sregex_iterator(text.begin(), text.end(), kIntegerRe); it != std::sregex_iterator(); ++it) {
    const std::smatch& m = *it;
    std::string digits = m.str();
    if (digits.size() < 3 || digits.size() > 6) continue;
    size_t begin = static_cast<size_t>(m.position());
    size_t end = begin + digits.size();
    if (isGlued(text, begin, end)) continue;

    // years
    if (digits.size() == 4 && (digits.compare(0, 2, "19") == 0 || digits.compare(0, 2, "20") == 0)) continue;

    size_t nbBegin = begin >= 8 ? begin - 8 : 0;
    std::string neighborhood = text.substr(nbBegin, std::min(text.size(), end + 8) - nbBegin);
    if (std::regex_search(neighborhood, kPhoneRe) || insidePhoneNumber(text, begin, end)) continue;

    // five-digit runs are usually SKUs or store numbers
    if (digits.size() == 5) {
      size_t ctxBegin = begin >= 18 ? begin - 18 : 0;
      std::string ctx = text.substr(ctxBegin, std::min(text.size(), end + 18) - ctxBegin);
      if (ctx.find('$') == std::string::npos) continue;
    }

    out.add(std::stoll(digits), digits, begin, MoneyEncoding::ImpliedCents);
  }
}

} // namespace

std::vector<MoneyToken> extractMoneyTokens(const std::string& text, MoneyMode mode,
                                           const ScoringConstants& scoring) {
  Collector collector{scoring, {}};
  if (text.empty()) return {};

  scanDecimalPass(text, kExplicitRe, false, MoneyEncoding::ExplicitDecimal, collector);
  scanDecimalPass(text, kEuroRe, true, MoneyEncoding::EuroStyleComma, collector);
  scanDecimalPass(text, kTruncatedRe, false, MoneyEncoding::TruncatedDecimal, collector);
  if (mode == MoneyMode::Labeled && impliedCentsAllowed(text)) {
    scanImpliedCents(text, collector);
  }

  std::set<std::pair<Cents, int>> seen;
  std::vector<MoneyToken> out;
  for (auto& t : collector.tokens) {
    if (!seen.insert({t.value, t.offset / 4}).second) continue;
    out.push_back(std::move(t));
  }
  std::stable_sort(out.begin(), out.end(), [](const MoneyToken& a, const MoneyToken& b) {
    return a.offset < b.offset;
  });
  return out;
}

bool hasMoneyShape(const std::string& text) {
  return std::regex_search(text, kMoneyShapeRe);
}

bool hasTotalOrTaxKeyword(const std::string& text) {
  static const std::vector<std::string> keywords = {
    "sale total", "grand total", "total", "amount due", "balance due", "invoice total",
    "subtotal", "sales tax", "tax", "vat", "gst", "hst",
  };
  return containsAny(toLower(text), keywords);
}
