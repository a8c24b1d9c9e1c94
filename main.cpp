#include "config.hpp"
#include "date_extractor.hpp"
#include "leptonica_preprocessor.hpp"
#include "logging.hpp"
#include "pdf_text.hpp"
#include "pipeline.hpp"
#include "record_format.hpp"
#include "tesseract_engine.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--text] [--config=FILE] [--lang=eng] [--explanation=TEXT] [--business-type=TYPE]"
               " [--business-state=ST] [--log-level=LEVEL] [--log-file=FILE] <file>...\n";
}

bool takeValue(const std::string& arg, const std::string& prefix, std::string& out) {
  if (arg.rfind(prefix, 0) != 0) return false;
  out = arg.substr(prefix.size());
  return true;
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::vector<std::string> inputs;
    bool textMode = false;
    std::string configPath;
    std::string language;
    std::string logLevel = "warn";
    std::string logFile;
    BusinessContext context;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--text") {
        textMode = true;
      } else if (arg == "--help" || arg == "-h") {
        printUsage(argv[0]);
        return 0;
      } else if (takeValue(arg, "--config=", configPath) || takeValue(arg, "--lang=", language) ||
                 takeValue(arg, "--explanation=", context.explanation) ||
                 takeValue(arg, "--business-type=", context.businessType) ||
                 takeValue(arg, "--business-state=", context.businessState) ||
                 takeValue(arg, "--log-level=", logLevel) || takeValue(arg, "--log-file=", logFile)) {
        continue;
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else {
        inputs.push_back(arg);
      }
    }

    if (inputs.empty()) {
      printUsage(argv[0]);
      return 2;
    }
    for (const auto& path : inputs) {
      if (!std::filesystem::exists(path)) {
        std::cerr << "File not found: " << path << "\n";
        printUsage(argv[0]);
        return 2;
      }
    }

    initLogging(logLevel, logFile);
    ExtractorConfig config = configPath.empty() ? defaultExtractorConfig() : loadExtractorConfig(configPath);
    if (language.empty()) language = config.ocr.language;

    if (textMode) {
      CalendarDate reference = today();
      for (const auto& path : inputs) {
        std::cout << toJson(extractFromTextFile(path, context, config, reference));
      }
      return 0;
    }

    TesseractEngine engine(language, config.ocr.tessdataPath, config.ocr.dpi);
    LeptonicaPreprocessor preprocessor;
    ReceiptPipeline pipeline(config, engine, preprocessor);
    int status = 0;
    for (const auto& path : inputs) {
      logger()->info("processing {}", path);
      std::vector<std::uint8_t> bytes;
      try {
        bytes = readFileBytes(path);
      } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        status = 1;
        continue;
      }
      std::cout << toJson(pipeline.extract(bytes, language, context));
    }
    return status;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
