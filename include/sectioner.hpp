#pragma once

#include <map>
#include <string>
#include <vector>

// Headers the OCR orchestrator writes in front of each specialized pass.
extern const char* const kVendorPassMarker;
extern const char* const kTotalsMixedPassMarker;
extern const char* const kTotalsDigitsPassMarker;
extern const char* const kNumericPassMarker;
extern const char* const kSoftTextPassMarker;
extern const char* const kPageBreakMarker;

extern const char* const kSectionFull;
extern const char* const kSectionVendor;
extern const char* const kSectionTotals;
extern const char* const kSectionNumeric;
extern const char* const kSectionSoftText;
extern const char* const kSectionOther;

struct SectionedText {
  // Section name -> non-empty trimmed lines. "full" is always present and
  // holds every non-marker line.
  std::map<std::string, std::vector<std::string>> sections;

  const std::vector<std::string>& full() const;
  // Empty when the section is absent.
  const std::vector<std::string>& section(const std::string& name) const;
  bool has(const std::string& name) const;
};

bool isSectionMarker(const std::string& line);

SectionedText sectionText(const std::string& text);
