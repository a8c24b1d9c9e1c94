#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "date_extractor.hpp"
#include "ocr_orchestrator.hpp"
#include "receipt_types.hpp"

// Field extraction, categorization and the review gate over already
// recognized text. Pure: identical inputs give identical records.
ExtractionRecord extractFromText(const OcrResult& ocr, const BusinessContext& context,
                                 const ExtractorConfig& config, const CalendarDate& reference);

// Reads a file of already recognized text and runs extractFromText on it.
// Never throws: read or extraction failures give a PIPELINE_FAULT record.
ExtractionRecord extractFromTextFile(const std::string& path, const BusinessContext& context,
                                     const ExtractorConfig& config, const CalendarDate& reference);

// Reviewer corrections; unset members keep the extracted value.
struct ReviewPatch {
  std::optional<std::string> vendor;
  std::optional<std::string> date;
  std::optional<Cents> tax;
  std::optional<Cents> total;
  std::optional<std::string> category;
};

// New record with the corrections applied at full confidence and the review
// gate re-run. `record` is left untouched.
ExtractionRecord applyReviewPatch(const ExtractionRecord& record, const ReviewPatch& patch,
                                  const ExtractorConfig& config);

class ReceiptPipeline {
public:
  ReceiptPipeline(const ExtractorConfig& config, OcrEngine& engine, ImagePreprocessor& preprocessor);

  // Image or PDF bytes in, record out. Never throws: internal faults yield a
  // record flagged PIPELINE_FAULT.
  ExtractionRecord extract(const std::vector<std::uint8_t>& bytes, const std::string& language,
                           const BusinessContext& context);
  ExtractionRecord extract(const std::vector<std::uint8_t>& bytes, const std::string& language,
                           const BusinessContext& context, const CalendarDate& reference);

  // PDF text layer when it is long enough, otherwise multi-pass OCR.
  OcrResult acquireText(const std::vector<std::uint8_t>& bytes, const std::string& language);

private:
  const ExtractorConfig& config_;
  OcrOrchestrator orchestrator_;
};

using OcrEngineFactory = std::function<std::unique_ptr<OcrEngine>()>;
using PreprocessorFactory = std::function<std::unique_ptr<ImagePreprocessor>()>;

struct BatchItem {
  std::vector<std::uint8_t> bytes;
  BusinessContext context;
};

// Documents are processed concurrently, at most `maxParallel` at a time, each
// on its own engine and preprocessor; the factories must be callable from any
// thread. Results keep input order.
std::vector<ExtractionRecord> processBatch(const std::vector<BatchItem>& items, const std::string& language,
                                           const ExtractorConfig& config, const OcrEngineFactory& makeEngine,
                                           const PreprocessorFactory& makePreprocessor, size_t maxParallel = 4);
