#include "date_extractor.hpp"

#include "logging.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <regex>
#include <set>
#include <tuple>
#include <vector>

namespace {

const char* const kMonthNames =
    "jan|january|feb|february|mar|march|apr|april|may|jun|june|jul|july|aug|august|sep|sept|september|"
    "oct|october|nov|november|dec|december";

enum class DateShape { MonthDayYear, YearMonthDay, MonthNameDayYear, DayMonthNameYear };

struct DatePattern {
  std::regex re;
  DateShape shape;
  const char* tag;
};

const std::vector<DatePattern>& datePatterns() {
  static const std::vector<DatePattern> patterns = {
    {std::regex(R"(\b(\d{1,2})[/-](\d{1,2})[/-](\d{2,4})\b)"), DateShape::MonthDayYear, "mdy_slash"},
    {std::regex(R"(\b(\d{4})[/-](\d{1,2})[/-](\d{1,2})\b)"), DateShape::YearMonthDay, "ymd_dash"},
    {std::regex(std::string(R"(\b()") + kMonthNames + R"()\.?\s+(\d{1,2}),?\s+(\d{2,4})\b)", std::regex::icase),
     DateShape::MonthNameDayYear, "mon_d_y"},
    {std::regex(std::string(R"(\b(\d{1,2})\s+()") + kMonthNames + R"()\.?\s+(\d{2,4})\b)", std::regex::icase),
     DateShape::DayMonthNameYear, "d_mon_y"},
  };
  return patterns;
}

const std::vector<std::string> kDateLabels = {
  "date", "dated", "txn date", "trans date", "transaction date", "purchase date", "issued", "invoice date",
};

int monthFromName(const std::string& name) {
  static const char* const abbrev[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                       "jul", "aug", "sep", "oct", "nov", "dec"};
  std::string lo = toLower(name).substr(0, 3);
  for (int i = 0; i < 12; ++i) {
    if (lo == abbrev[i]) return i + 1;
  }
  return 0;
}

// Two-digit years pivot at 68: 00-68 -> 20xx, 69-99 -> 19xx.
int expandYear(const std::string& digits) {
  int y = std::stoi(digits);
  if (digits.size() == 2) return y <= 68 ? 2000 + y : 1900 + y;
  if (digits.size() == 4) return y;
  return -1;
}

struct DateCandidate {
  CalendarDate date;
  double score;
  std::string reason;
  std::string provenance;
};

std::vector<std::pair<CalendarDate, std::string>> dateMatches(const std::string& text) {
  std::vector<std::pair<CalendarDate, std::string>> out;
  std::set<std::tuple<int, int, int>> seen;
  for (const auto& p : datePatterns()) {
    for (auto it = std::sregex_iterator(text.begin(), text.end(), p.re); it != std::sregex_iterator(); ++it) {
      const std::smatch& m = *it;
      int y = 0, mo = 0, d = 0;
      switch (p.shape) {
        case DateShape::MonthDayYear:
          mo = std::stoi(m.str(1)); d = std::stoi(m.str(2)); y = expandYear(m.str(3));
          break;
        case DateShape::YearMonthDay:
          y = std::stoi(m.str(1)); mo = std::stoi(m.str(2)); d = std::stoi(m.str(3));
          break;
        case DateShape::MonthNameDayYear:
          mo = monthFromName(m.str(1)); d = std::stoi(m.str(2)); y = expandYear(m.str(3));
          break;
        case DateShape::DayMonthNameYear:
          d = std::stoi(m.str(1)); mo = monthFromName(m.str(2)); y = expandYear(m.str(3));
          break;
      }
      if (!isValidDate(y, mo, d)) continue;
      if (!seen.insert(std::make_tuple(y, mo, d)).second) continue;
      out.emplace_back(CalendarDate{y, mo, d}, std::string("Matched date pattern '") + p.tag + "'.");
    }
  }
  return out;
}

} // namespace

bool CalendarDate::operator<(const CalendarDate& o) const {
  return std::tie(year, month, day) < std::tie(o.year, o.month, o.day);
}

bool CalendarDate::operator<=(const CalendarDate& o) const {
  return !(o < *this);
}

bool CalendarDate::operator==(const CalendarDate& o) const {
  return year == o.year && month == o.month && day == o.day;
}

CalendarDate CalendarDate::addYears(int years) const {
  CalendarDate out{year + years, month, day};
  if (!isValidDate(out.year, out.month, out.day)) out.day = 28;
  return out;
}

std::string CalendarDate::iso() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

bool isValidDate(int year, int month, int day) {
  if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) return false;
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int limit = days[month - 1];
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) limit = 29;
  return day <= limit;
}

CalendarDate today() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return CalendarDate{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

FieldResult<std::string> extractDate(const SectionedText& text, const ExtractorConfig& config,
                                     const CalendarDate& reference) {
  const ScoringConstants& sc = config.scoring;
  const auto& lines = text.full();
  FieldResult<std::string> result;
  if (lines.empty()) {
    result.reasoning = "No OCR text.";
    return result;
  }

  std::vector<DateCandidate> candidates;

  size_t labelLimit = std::min(lines.size(), static_cast<size_t>(sc.dateLabelLines));
  for (size_t i = 0; i < labelLimit; ++i) {
    if (!containsAny(toLower(lines[i]), kDateLabels)) continue;
    size_t radius = static_cast<size_t>(sc.dateWindowRadius);
    size_t begin = i >= radius ? i - radius : 0;
    std::string window = joinLines(lines, " | ", begin, i + radius + 1);
    for (const auto& [date, reason] : dateMatches(window)) {
      candidates.push_back({date, sc.dateLabelScore, reason + " Found near date label in: '" + lines[i] + "'.",
                            "date_label"});
    }
  }

  std::vector<std::tuple<std::string, std::string, double>> blocks;
  if (!text.section(kSectionNumeric).empty()) {
    blocks.emplace_back(kSectionNumeric, joinLines(text.section(kSectionNumeric), "\n"), sc.dateNumericPassScore);
  }
  blocks.emplace_back("top_full", joinLines(lines, "\n", 0, static_cast<size_t>(sc.dateTopLines)), sc.dateTopLinesScore);
  blocks.emplace_back(kSectionFull, joinLines(lines, "\n"), sc.dateFullScore);

  for (const auto& [name, block, base] : blocks) {
    for (const auto& [date, reason] : dateMatches(block)) {
      candidates.push_back({date, base, reason + " Found by scan in " + name + ".", name});
    }
  }

  if (candidates.empty()) {
    result.reasoning = "No date pattern detected.";
    return result;
  }

  CalendarDate future = reference.addYears(sc.dateFutureYears);
  CalendarDate old = reference.addYears(-sc.dateOldYears);
  CalendarDate recent = reference.addYears(-sc.dateRecentYears);

  const DateCandidate* best = nullptr;
  double bestScore = -1.0;
  std::string bestReason;
  for (const auto& c : candidates) {
    double score = c.score;
    std::string reason = c.reason;
    if (c.date > future) {
      score -= sc.dateFuturePenalty;
      reason += " Penalized: implausible far-future date.";
    }
    if (c.date < old) {
      score -= sc.dateOldPenalty;
      reason += " Penalized: very old date.";
    }
    if (recent <= c.date && c.date <= reference) score += sc.dateRecentBump;
    score = clamp01(score);
    if (score > bestScore) {
      bestScore = score;
      best = &c;
      bestReason = reason;
    }
  }

  result.value = best->date.iso();
  result.confidence = toConfidence100(bestScore);
  result.reasoning = bestReason;
  result.provenance = best->provenance;
  logger()->debug("date: {} ({}) {}", *result.value, result.confidence, result.reasoning);
  return result;
}
