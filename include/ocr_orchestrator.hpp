#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "receipt_types.hpp"

// 8-bit grayscale, row-major, no padding.
struct GrayImage {
  int width = 0;
  int height = 0;
  std::vector<std::uint8_t> pixels;

  bool empty() const { return width <= 0 || height <= 0; }
};

// Tesseract page segmentation modes used by the passes.
enum class PageSegMode { SingleBlock = 6, SingleLine = 7, SparseText = 11 };

struct OcrRequest {
  std::string language;
  PageSegMode mode = PageSegMode::SingleBlock;
  std::string whitelist;  // empty: no restriction
};

class OcrEngine {
public:
  virtual ~OcrEngine() = default;
  // May throw; the orchestrator treats a throw as an empty attempt.
  virtual std::string recognize(const GrayImage& image, const OcrRequest& request) = 0;
};

enum class ImageVariant { Denoised, Sharpened, VendorStrip, SoftText };

struct PreparedImage {
  GrayImage image;
  bool deskewed = false;
};

class ImagePreprocessor {
public:
  virtual ~ImagePreprocessor() = default;
  // Decodes encoded image bytes, normalizes size and straightens the page.
  // Throws std::runtime_error when the bytes cannot be decoded.
  virtual PreparedImage prepare(const std::vector<std::uint8_t>& bytes) = 0;
  virtual GrayImage makeVariant(const GrayImage& image, ImageVariant variant) = 0;
};

extern const char* const kDigitsWhitelist;

GrayImage cropTop(const GrayImage& image, double fraction);
GrayImage cropRight(const GrayImage& image, double fraction);

// Cheap 0..1 legibility estimate that needs no second engine call.
double textQualityScore(const std::string& text);

// Mentions totals or tax but carries nothing money-shaped.
bool looksLikeTotalsMissing(const std::string& text);

// First six lines are too short, letter-poor or digit-dominated.
bool looksLikeVendorLettersMissing(const std::string& text);

// Runs the bounded set of OCR passes over one page and merges them into a
// marker-annotated text blob. Never throws. Holds references only; one
// orchestrator (and engine) per thread.
class OcrOrchestrator {
public:
  OcrOrchestrator(OcrEngine& engine, ImagePreprocessor& preprocessor, const OcrSettings& settings);

  OcrResult recognizeImage(const std::vector<std::uint8_t>& bytes, const std::string& language,
                           const std::string& tag = "img");

  // Rasterized pages; pages are joined with the page-break marker.
  OcrResult recognizePages(const std::vector<std::vector<std::uint8_t>>& pages, const std::string& language);

private:
  struct PassOutcome {
    std::string text;  // normalized
    double score = 0.0;
    std::string source;
  };

  using NamedImage = std::pair<std::string, GrayImage>;

  PassOutcome bestOf(const std::vector<NamedImage>& variants, const std::vector<PageSegMode>& modes,
                     const std::string& whitelist, const std::string& language, const std::string& tag);
  void addVariant(std::vector<NamedImage>& out, const char* name, const GrayImage& image, ImageVariant variant);

  OcrEngine& engine_;
  ImagePreprocessor& preprocessor_;
  OcrSettings settings_;
};
