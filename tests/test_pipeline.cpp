#include <catch2/catch_all.hpp>

#include "fakes.hpp"
#include "pdf_text.hpp"
#include "pipeline.hpp"
#include "record_format.hpp"
#include "review_gate.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace {

const CalendarDate kReference{2026, 10, 19};

OcrResult ocrText(const std::string& text) {
  OcrResult ocr;
  ocr.text = text;
  ocr.status = OcrStatus::Success;
  ocr.confidence = 100.0;
  ocr.sourceTag = "text_input";
  return ocr;
}

ExtractionRecord run(const std::string& text, const BusinessContext& context = {}) {
  static const ExtractorConfig config = defaultExtractorConfig();
  return extractFromText(ocrText(text), context, config, kReference);
}

bool hasFlag(const ExtractionRecord& r, const std::string& flag) {
  return std::find(r.flags.begin(), r.flags.end(), flag) != r.flags.end();
}

std::vector<std::uint8_t> bytesOf(const std::string& s) {
  return std::vector<std::uint8_t>(s.begin(), s.end());
}

} // namespace

TEST_CASE("clean receipt needs no review", "[pipeline]") {
  ExtractionRecord r = run(autoZoneReceipt());

  REQUIRE(r.vendor.value == std::string("AutoZone"));
  REQUIRE(r.total.value == Cents{4512});
  REQUIRE(r.tax.value == Cents{312});
  REQUIRE(r.date.value == std::string("2026-10-02"));
  REQUIRE(r.category.category == std::string("Car & Truck"));
  REQUIRE(r.category.source == CategorySource::Rules);

  REQUIRE(r.vendor.confidence >= 80.0);
  REQUIRE(r.total.confidence >= 80.0);
  REQUIRE(r.tax.confidence >= 80.0);
  REQUIRE(r.date.confidence >= 80.0);
  REQUIRE(r.category.confidence >= 0.80);

  REQUIRE(r.flags.empty());
  REQUIRE_FALSE(r.needsReview);
}

TEST_CASE("bare TAX label on a clean receipt stays below the strong score", "[pipeline]") {
  ExtractionRecord r = run("AUTOZONE STORE #5432\n"
                           "DATE 10/02/2026\n"
                           "GRAND TOTAL $45.12\n"
                           "TAX $3.12\n");

  REQUIRE(r.vendor.value == std::string("AutoZone"));
  REQUIRE(r.total.value == Cents{4512});
  REQUIRE(r.tax.value == Cents{312});
  REQUIRE(r.tax.confidence == Catch::Approx(73.0));
  REQUIRE(r.tax.reasoning == "Matched medium tax label; Source: (full) 'TAX $3.12'");
  REQUIRE(r.category.category == std::string("Car & Truck"));

  REQUIRE(r.vendor.confidence >= 80.0);
  REQUIRE(r.total.confidence >= 80.0);
  REQUIRE(r.date.confidence >= 80.0);
  REQUIRE(r.category.confidence >= 0.80);

  REQUIRE(r.flags.empty());
  REQUIRE_FALSE(r.needsReview);
}

TEST_CASE("very long OCR lines are processed without failing", "[pipeline]") {
  ExtractionRecord labeled = run("ACME\nFrom: " + std::string(100000, 'a') + "\nTotal 12.00\n");
  REQUIRE(labeled.total.value == Cents{1200});
  REQUIRE(labeled.needsReview == !labeled.flags.empty());

  ExtractionRecord digits = run("ACME\nTOTAL " + std::string(100000, '7') + "\n");
  REQUIRE_FALSE(digits.total.value);
  REQUIRE(hasFlag(digits, "MISSING_TOTAL"));
  REQUIRE(digits.needsReview);
}

TEST_CASE("tax is inferred when only subtotal and total are printed", "[pipeline]") {
  ExtractionRecord r = run("ACME HARDWARE\nDATE 10/02/2026\nSubtotal 20.00\nTotal 21.50\n");
  REQUIRE(r.tax.value == Cents{150});
  REQUIRE(r.total.value == Cents{2150});
  REQUIRE(r.tax.reasoning.find("Subtotal 20.00") != std::string::npos);
  REQUIRE(r.tax.reasoning.find("Total 21.50") != std::string::npos);
}

TEST_CASE("total keywords without amounts send the record to review", "[pipeline]") {
  ExtractionRecord r = run("ACME HARDWARE\nTOTAL\nTAX\n");
  REQUIRE_FALSE(r.total.value);
  REQUIRE(r.total.confidence == 0.0);
  REQUIRE(hasFlag(r, "LOW_TOTAL_CONFIDENCE"));
  REQUIRE(hasFlag(r, "MISSING_TOTAL"));
  REQUIRE(r.needsReview);
}

TEST_CASE("identical input gives an identical record", "[pipeline]") {
  for (const std::string text : {std::string(autoZoneReceipt()), std::string("ACME\nTOTAL\n"), std::string("")}) {
    REQUIRE(toJson(run(text)) == toJson(run(text)));
  }
}

TEST_CASE("needsReview mirrors the flags", "[pipeline]") {
  const std::vector<std::string> texts = {
    autoZoneReceipt(),
    "ITEM 797860\nTHANK YOU\n",
    "Subtotal 20.00\nTotal 21.50\n",
    "",
    "TOTAL 797.860\n",
  };
  for (const auto& text : texts) {
    ExtractionRecord r = run(text);
    REQUIRE(r.needsReview == !r.flags.empty());
  }
}

TEST_CASE("SKU-like numbers never become the total", "[pipeline]") {
  REQUIRE_FALSE(run("ITEM 797860\nTHANK YOU\n").total.value);
  ExtractionRecord r = run("TOTAL 797.860\nTAX 797.860\n");
  REQUIRE_FALSE(r.total.value);
  REQUIRE_FALSE(r.tax.value);
}

TEST_CASE("states without sales tax clear the tax field", "[pipeline]") {
  BusinessContext context;
  context.businessState = " or ";
  ExtractionRecord r = run(autoZoneReceipt(), context);

  REQUIRE_FALSE(r.tax.value);
  REQUIRE(r.tax.provenance == std::string("no_sales_tax_state"));
  REQUIRE(r.tax.reasoning == "Cleared: OR has no statewide sales tax.");
  REQUIRE(r.flags == std::vector<std::string>{kFlagNoSalesTaxState});
  REQUIRE(r.needsReview);
}

TEST_CASE("reviewer corrections re-run the gate", "[pipeline]") {
  ExtractorConfig config = defaultExtractorConfig();
  ExtractionRecord original = run("ACME HARDWARE\nTOTAL\nTAX\n");

  ReviewPatch patch;
  patch.total = 1000;
  patch.vendor = "Acme Hardware";
  patch.date = "2026-10-01";
  patch.category = "Supplies";
  ExtractionRecord fixed = applyReviewPatch(original, patch, config);

  REQUIRE(fixed.total.value == Cents{1000});
  REQUIRE(fixed.total.confidence == 100.0);
  REQUIRE(fixed.total.provenance == std::string("review"));
  REQUIRE(fixed.category.category == std::string("Supplies"));
  REQUIRE_FALSE(hasFlag(fixed, "MISSING_TOTAL"));
  REQUIRE_FALSE(hasFlag(fixed, "LOW_TOTAL_CONFIDENCE"));
  REQUIRE(fixed.flags.empty());
  REQUIRE_FALSE(fixed.needsReview);

  REQUIRE_FALSE(original.total.value);
  REQUIRE(original.needsReview);
}

TEST_CASE("image bytes run through multi-pass OCR", "[pipeline]") {
  ExtractorConfig config = defaultExtractorConfig();
  FakeOcrEngine engine(autoZoneReceipt());
  FakePreprocessor preprocessor;
  ReceiptPipeline pipeline(config, engine, preprocessor);

  ExtractionRecord r = pipeline.extract(bytesOf("not a pdf"), "eng", {}, kReference);

  REQUIRE(r.ocr.sourceTag.rfind("base:img_base_denoise_psm6", 0) == 0);
  REQUIRE(r.vendor.value == std::string("AutoZone"));
  REQUIRE(r.vendor.provenance == std::string("alias_match:vendor_pass"));
  REQUIRE(r.total.value == Cents{4512});
  REQUIRE(r.tax.value == Cents{312});
  REQUIRE(r.tax.provenance == std::string("tax_label:totals_pass"));
  REQUIRE(r.needsReview == !r.flags.empty());
}

TEST_CASE("unreadable PDFs degrade to a failed OCR result", "[pipeline]") {
  ExtractorConfig config = defaultExtractorConfig();
  FakeOcrEngine engine(autoZoneReceipt());
  FakePreprocessor preprocessor;
  ReceiptPipeline pipeline(config, engine, preprocessor);

  ExtractionRecord r = pipeline.extract(bytesOf("%PDF-1.4 truncated"), "eng", {}, kReference);
  REQUIRE(r.ocr.status == OcrStatus::Failed);
  REQUIRE(r.ocr.sourceTag == "pdf_render_failed");
  REQUIRE(hasFlag(r, "OCR_FAILED"));
  REQUIRE(r.needsReview);
  REQUIRE(engine.calls == 0);
}

TEST_CASE("batch keeps input order and isolates failures", "[pipeline]") {
  ExtractorConfig config = defaultExtractorConfig();
  std::vector<BatchItem> items(3);
  for (auto& item : items) item.bytes = bytesOf("image");
  items[1].context.businessState = "DE";

  auto engines = []() -> std::unique_ptr<OcrEngine> { return std::make_unique<FakeOcrEngine>(autoZoneReceipt()); };
  auto preprocessors = []() -> std::unique_ptr<ImagePreprocessor> { return std::make_unique<FakePreprocessor>(); };

  auto records = processBatch(items, "eng", config, engines, preprocessors, 2);
  REQUIRE(records.size() == 3);
  REQUIRE(records[0].total.value == Cents{4512});
  REQUIRE(records[2].total.value == Cents{4512});
  REQUIRE(std::find(records[1].flags.begin(), records[1].flags.end(), kFlagNoSalesTaxState) != records[1].flags.end());
  REQUIRE_FALSE(records[1].tax.value);

  auto broken = processBatch(items, "eng", config, [] { return std::unique_ptr<OcrEngine>(); }, preprocessors);
  REQUIRE(broken.size() == 3);
  for (const auto& r : broken) {
    REQUIRE(r.ocr.sourceTag == "engine_unavailable");
    REQUIRE(hasFlag(r, kFlagPipelineFault));
    REQUIRE(r.needsReview);
  }
}

TEST_CASE("text files are read one by one and failures stay per file", "[pipeline]") {
  ExtractorConfig config = defaultExtractorConfig();
  ScopedTempFile receipt(bytesOf(autoZoneReceipt()), ".txt");

  ExtractionRecord ok = extractFromTextFile(receipt.path(), {}, config, kReference);
  REQUIRE(ok.ocr.sourceTag == "text_input");
  REQUIRE(ok.total.value == Cents{4512});
  REQUIRE_FALSE(ok.needsReview);

  ExtractionRecord missing = extractFromTextFile("/nonexistent/receipt.txt", {}, config, kReference);
  REQUIRE(missing.ocr.status == OcrStatus::Failed);
  REQUIRE(hasFlag(missing, kFlagPipelineFault));
  REQUIRE(missing.vendor.reasoning == "Not extracted: Cannot open file: /nonexistent/receipt.txt");
  REQUIRE(missing.needsReview);
}
