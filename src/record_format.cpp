#include "record_format.hpp"

#include <cstdio>
#include <sstream>

namespace {

std::string quoted(const std::string& s) {
  return "\"" + jsonEscape(s) + "\"";
}

std::string number(double x) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", x);
  std::string out = buf;
  // trim trailing zeros: 91.00 -> 91, 0.90 -> 0.9
  while (!out.empty() && out.back() == '0') out.pop_back();
  if (!out.empty() && out.back() == '.') out.pop_back();
  return out;
}

template <typename T, typename Render>
void printField(std::ostringstream& os, const char* name, const FieldResult<T>& field, Render render) {
  os << "  \"" << name << "\": {\n";
  os << "    \"value\": " << (field.value ? render(*field.value) : std::string("null")) << ",\n";
  os << "    \"confidence\": " << number(field.confidence) << ",\n";
  os << "    \"reasoning\": " << quoted(field.reasoning) << ",\n";
  os << "    \"provenance\": " << (field.provenance ? quoted(*field.provenance) : std::string("null")) << "\n";
  os << "  },\n";
}

} // namespace

std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  return out;
}

std::string toJson(const ExtractionRecord& record) {
  auto text = [](const std::string& v) { return quoted(v); };
  auto money = [](Cents v) { return formatCents(v); };

  std::ostringstream os;
  os << "{\n";
  os << "  \"ocr\": {\n";
  os << "    \"status\": " << quoted(toString(record.ocr.status)) << ",\n";
  os << "    \"source\": " << quoted(record.ocr.sourceTag) << ",\n";
  os << "    \"confidence\": " << number(record.ocr.confidence) << ",\n";
  os << "    \"text\": " << quoted(record.ocr.text) << "\n";
  os << "  },\n";

  printField(os, "vendor", record.vendor, text);
  printField(os, "date", record.date, text);
  printField(os, "tax", record.tax, money);
  printField(os, "total", record.total, money);

  os << "  \"category\": {\n";
  os << "    \"value\": " << (record.category.category ? quoted(*record.category.category) : std::string("null")) << ",\n";
  os << "    \"confidence\": " << number(record.category.confidence) << ",\n";
  os << "    \"reasoning\": " << quoted(record.category.reasoning) << ",\n";
  os << "    \"source\": " << quoted(toString(record.category.source)) << "\n";
  os << "  },\n";

  os << "  \"flags\": [";
  for (size_t i = 0; i < record.flags.size(); ++i) {
    os << quoted(record.flags[i]) << (i + 1 == record.flags.size() ? "" : ", ");
  }
  os << "],\n";
  os << "  \"needsReview\": " << (record.needsReview ? "true" : "false") << "\n";
  os << "}\n";
  return os.str();
}
