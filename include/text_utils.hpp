#pragma once

#include <string>
#include <vector>

std::string trim(const std::string& s);
std::string toLower(std::string s);

// Longest line handed to the regex scanners. Longer lines are wrapped.
constexpr size_t kMaxLineChars = 1000;

// OCR cleanup: unify line endings, drop non-printable bytes, collapse
// whitespace inside each line, drop empty lines and wrap lines longer than
// kMaxLineChars.
std::string normalizeText(const std::string& text);

// Non-empty trimmed lines, each at most kMaxLineChars long.
std::vector<std::string> splitLines(const std::string& text);

std::string joinLines(const std::vector<std::string>& lines, const std::string& sep,
                      size_t begin = 0, size_t end = std::string::npos);

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles);

// Replaces characters other than letters, digits and ' & . / - with spaces.
std::string stripNoise(const std::string& s);
std::string collapseSpaces(const std::string& s);

// Lower-case letters and digits only.
std::string alnumOnly(const std::string& s);

int countAlpha(const std::string& s);
int countDigits(const std::string& s);
