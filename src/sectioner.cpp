#include "sectioner.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>

const char* const kVendorPassMarker = "----- VENDOR PASS (TOP STRIP) -----";
const char* const kTotalsMixedPassMarker = "----- TOTALS PASS (RIGHT STRIP MIXED) -----";
const char* const kTotalsDigitsPassMarker = "----- TOTALS PASS (RIGHT STRIP DIGITS) -----";
const char* const kNumericPassMarker = "----- NUMERIC PASS (FULL) -----";
const char* const kSoftTextPassMarker = "----- SOFT TEXT PASS (FULL) -----";
const char* const kPageBreakMarker = "----- PAGE BREAK -----";

const char* const kSectionFull = "full";
const char* const kSectionVendor = "vendor_pass";
const char* const kSectionTotals = "totals_pass";
const char* const kSectionNumeric = "numeric_pass";
const char* const kSectionSoftText = "softtext_pass";
const char* const kSectionOther = "other_pass";

namespace {

std::string toUpper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string sectionForMarker(const std::string& upper) {
  if (upper.find("VENDOR") != std::string::npos) return kSectionVendor;
  if (upper.find("TOTAL") != std::string::npos) return kSectionTotals;
  if (upper.find("NUMERIC") != std::string::npos) return kSectionNumeric;
  if (upper.find("SOFT TEXT") != std::string::npos || upper.find("SOFTTEXT") != std::string::npos) {
    return kSectionSoftText;
  }
  return kSectionOther;
}

} // namespace

const std::vector<std::string>& SectionedText::full() const {
  return section(kSectionFull);
}

const std::vector<std::string>& SectionedText::section(const std::string& name) const {
  static const std::vector<std::string> empty;
  auto it = sections.find(name);
  return it == sections.end() ? empty : it->second;
}

bool SectionedText::has(const std::string& name) const {
  return sections.find(name) != sections.end();
}

bool isSectionMarker(const std::string& line) {
  return line.find("-----") != std::string::npos && toUpper(line).find("PASS") != std::string::npos;
}

SectionedText sectionText(const std::string& text) {
  SectionedText out;
  auto& full = out.sections[kSectionFull];
  std::string current = kSectionFull;

  for (const auto& line : splitLines(text)) {
    // a new page starts over in the base pass
    if (line == kPageBreakMarker) {
      current = kSectionFull;
      continue;
    }
    if (isSectionMarker(line)) {
      current = sectionForMarker(toUpper(line));
      out.sections[current];
      continue;
    }
    full.push_back(line);
    if (current != kSectionFull) out.sections[current].push_back(line);
  }
  return out;
}
