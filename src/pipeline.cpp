#include "pipeline.hpp"

#include "category_classifier.hpp"
#include "logging.hpp"
#include "pdf_text.hpp"
#include "review_gate.hpp"
#include "sectioner.hpp"
#include "tax_extractor.hpp"
#include "text_utils.hpp"
#include "total_extractor.hpp"
#include "vendor_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <future>
#include <stdexcept>

namespace {

std::string upperState(const std::string& s) {
  std::string out = trim(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

ExtractionRecord faultRecord(const OcrResult& ocr, const std::string& what) {
  ExtractionRecord record;
  record.ocr = ocr;
  record.vendor.reasoning = "Not extracted: " + what;
  record.date.reasoning = record.vendor.reasoning;
  record.tax.reasoning = record.vendor.reasoning;
  record.total.reasoning = record.vendor.reasoning;
  record.category.reasoning = record.vendor.reasoning;
  record.flags = {kFlagPipelineFault};
  return record;
}

} // namespace

ExtractionRecord extractFromText(const OcrResult& ocr, const BusinessContext& context,
                                 const ExtractorConfig& config, const CalendarDate& reference) {
  ExtractionRecord record;
  record.ocr = ocr;

  SectionedText sections = sectionText(normalizeText(ocr.text));
  record.vendor = extractVendor(sections, config);
  record.date = extractDate(sections, config, reference);
  record.tax = extractTax(sections, config);
  record.total = extractTotal(sections, config, record.tax.value);

  try {
    record.category = classifyCategory(record.vendor.value, ocr.text, context, config);
  } catch (const std::exception& e) {
    logger()->error("category classification failed: {}", e.what());
    record.category = CategoryResult{};
    record.category.reasoning = std::string("Category engine error: ") + e.what();
    record.flags.push_back(kFlagCategoryEngineError);
  }

  std::string state = upperState(context.businessState);
  const auto& exempt = config.tables.noSalesTaxStates;
  if (!state.empty() && std::find(exempt.begin(), exempt.end(), state) != exempt.end()) {
    record.tax = FieldResult<Cents>{};
    record.tax.reasoning = "Cleared: " + state + " has no statewide sales tax.";
    record.tax.provenance = "no_sales_tax_state";
    record.flags.push_back(kFlagNoSalesTaxState);
  }

  return applyReviewGate(std::move(record), config.scoring);
}

ExtractionRecord extractFromTextFile(const std::string& path, const BusinessContext& context,
                                     const ExtractorConfig& config, const CalendarDate& reference) {
  OcrResult ocr;
  ocr.sourceTag = "text_input";
  try {
    std::vector<std::uint8_t> bytes = readFileBytes(path);
    ocr.text.assign(bytes.begin(), bytes.end());
    ocr.confidence = 100.0;
    ocr.status = OcrStatus::Success;
    return extractFromText(ocr, context, config, reference);
  } catch (const std::exception& e) {
    logger()->error("extraction failed for {}: {}", path, e.what());
    ocr.text.clear();
    ocr.confidence = 0.0;
    ocr.status = OcrStatus::Failed;
    return applyReviewGate(faultRecord(ocr, e.what()), config.scoring);
  }
}

ExtractionRecord applyReviewPatch(const ExtractionRecord& record, const ReviewPatch& patch,
                                  const ExtractorConfig& config) {
  ExtractionRecord out = record;
  const std::string reason = "corrected by reviewer";
  auto correct = [&](auto& field, const auto& value) {
    if (!value) return;
    field.value = *value;
    field.confidence = 100.0;
    field.reasoning = reason;
    field.provenance = "review";
  };
  correct(out.vendor, patch.vendor);
  correct(out.date, patch.date);
  correct(out.tax, patch.tax);
  correct(out.total, patch.total);
  if (patch.category) {
    out.category.category = *patch.category;
    out.category.confidence = 1.0;
    out.category.reasoning = reason;
    out.category.source = CategorySource::Rules;
  }
  return applyReviewGate(std::move(out), config.scoring);
}

ReceiptPipeline::ReceiptPipeline(const ExtractorConfig& config, OcrEngine& engine, ImagePreprocessor& preprocessor)
  : config_(config), orchestrator_(engine, preprocessor, config.ocr) {}

OcrResult ReceiptPipeline::acquireText(const std::vector<std::uint8_t>& bytes, const std::string& language) {
  if (!isPdfData(bytes)) return orchestrator_.recognizeImage(bytes, language);

  ScopedTempFile pdf(bytes, ".pdf");
  try {
    std::string text = normalizeText(extractPdfText(pdf.path()));
    if (static_cast<int>(text.size()) >= config_.ocr.pdfTextMinChars) {
      OcrResult result;
      result.text = text;
      result.confidence = config_.ocr.pdfTextConfidence;
      result.status = OcrStatus::Success;
      result.sourceTag = "pdf_text";
      return result;
    }
  } catch (const std::exception& e) {
    logger()->warn("PDF text layer unavailable: {}", e.what());
  }

  std::vector<std::vector<std::uint8_t>> pages;
  try {
    pages = rasterizePdfPages(pdf.path(), config_.ocr.maxPdfPages, config_.ocr.dpi);
  } catch (const std::exception& e) {
    logger()->warn("PDF rasterization failed: {}", e.what());
  }
  return orchestrator_.recognizePages(pages, language);
}

ExtractionRecord ReceiptPipeline::extract(const std::vector<std::uint8_t>& bytes, const std::string& language,
                                          const BusinessContext& context) {
  return extract(bytes, language, context, today());
}

ExtractionRecord ReceiptPipeline::extract(const std::vector<std::uint8_t>& bytes, const std::string& language,
                                          const BusinessContext& context, const CalendarDate& reference) {
  OcrResult ocr;
  ocr.sourceTag = "not_started";
  try {
    ocr = acquireText(bytes, language);
    return extractFromText(ocr, context, config_, reference);
  } catch (const std::exception& e) {
    logger()->error("extraction failed: {}", e.what());
    return applyReviewGate(faultRecord(ocr, e.what()), config_.scoring);
  }
}

std::vector<ExtractionRecord> processBatch(const std::vector<BatchItem>& items, const std::string& language,
                                           const ExtractorConfig& config, const OcrEngineFactory& makeEngine,
                                           const PreprocessorFactory& makePreprocessor, size_t maxParallel) {
  std::vector<ExtractionRecord> records;
  records.reserve(items.size());
  CalendarDate reference = today();
  size_t width = std::max<size_t>(1, maxParallel);

  auto work = [&](const BatchItem& item) {
    try {
      std::unique_ptr<OcrEngine> engine = makeEngine();
      std::unique_ptr<ImagePreprocessor> preprocessor = makePreprocessor();
      if (!engine || !preprocessor) throw std::runtime_error("OCR engine factory returned nothing");
      ReceiptPipeline pipeline(config, *engine, *preprocessor);
      return pipeline.extract(item.bytes, language, item.context, reference);
    } catch (const std::exception& e) {
      logger()->error("batch worker setup failed: {}", e.what());
      OcrResult ocr;
      ocr.sourceTag = "engine_unavailable";
      return applyReviewGate(faultRecord(ocr, e.what()), config.scoring);
    }
  };

  for (size_t start = 0; start < items.size(); start += width) {
    size_t end = std::min(items.size(), start + width);
    std::vector<std::future<ExtractionRecord>> wave;
    for (size_t i = start; i < end; ++i) {
      wave.push_back(std::async(std::launch::async, work, std::cref(items[i])));
    }
    for (auto& f : wave) records.push_back(f.get());
  }
  return records;
}
