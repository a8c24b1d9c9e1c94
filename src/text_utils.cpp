#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

// Breaks at the last space inside the limit, or hard at the limit.
void appendWrapped(const std::string& line, std::vector<std::string>& out) {
  size_t pos = 0;
  while (line.size() - pos > kMaxLineChars) {
    size_t cut = line.rfind(' ', pos + kMaxLineChars);
    if (cut == std::string::npos || cut <= pos) cut = pos + kMaxLineChars;
    std::string piece = trim(line.substr(pos, cut - pos));
    if (!piece.empty()) out.push_back(piece);
    pos = cut;
  }
  std::string rest = trim(line.substr(pos));
  if (!rest.empty()) out.push_back(rest);
}

} // namespace

std::string trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string normalizeText(const std::string& text) {
  std::string cleaned;
  cleaned.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == '\r') {
      if (i + 1 < text.size() && text[i + 1] == '\n') continue;
      cleaned.push_back('\n');
    } else if (c == '\n' || c == '\t' || (c >= 0x20 && c <= 0x7E)) {
      cleaned.push_back(static_cast<char>(c));
    }
  }

  std::string out;
  std::istringstream iss(cleaned);
  std::string line;
  while (std::getline(iss, line)) {
    std::string collapsed;
    bool inSpace = false;
    for (char ch : line) {
      if (std::isspace(static_cast<unsigned char>(ch))) {
        inSpace = true;
        continue;
      }
      if (inSpace && !collapsed.empty()) collapsed.push_back(' ');
      inSpace = false;
      collapsed.push_back(ch);
    }
    if (collapsed.empty()) continue;
    std::vector<std::string> pieces;
    appendWrapped(collapsed, pieces);
    for (const auto& piece : pieces) {
      if (!out.empty()) out.push_back('\n');
      out += piece;
    }
  }
  return out;
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) {
    appendWrapped(trim(line), lines);
  }
  return lines;
}

std::string joinLines(const std::vector<std::string>& lines, const std::string& sep, size_t begin, size_t end) {
  end = std::min(end, lines.size());
  std::string out;
  for (size_t i = begin; i < end; ++i) {
    if (i > begin) out += sep;
    out += lines[i];
  }
  return out;
}

bool containsAny(const std::string& haystack, const std::vector<std::string>& needles) {
  for (const auto& n : needles) {
    if (haystack.find(n) != std::string::npos) return true;
  }
  return false;
}

std::string stripNoise(const std::string& s) {
  std::string out = s;
  for (char& ch : out) {
    unsigned char c = static_cast<unsigned char>(ch);
    bool keep = std::isalnum(c) || ch == ' ' || ch == '\'' || ch == '&' || ch == '.' || ch == '/' || ch == '-';
    if (!keep) ch = ' ';
  }
  return trim(out);
}

std::string collapseSpaces(const std::string& s) {
  std::string out;
  bool inSpace = false;
  for (char ch : trim(s)) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!inSpace) out.push_back(' ');
      inSpace = true;
    } else {
      out.push_back(ch);
      inSpace = false;
    }
  }
  return out;
}

std::string alnumOnly(const std::string& s) {
  std::string out;
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
  }
  return out;
}

int countAlpha(const std::string& s) {
  return static_cast<int>(std::count_if(s.begin(), s.end(), [](unsigned char c) { return std::isalpha(c) != 0; }));
}

int countDigits(const std::string& s) {
  return static_cast<int>(std::count_if(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; }));
}
