#include "ocr_orchestrator.hpp"

#include "logging.hpp"
#include "money.hpp"
#include "sectioner.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>

const char* const kDigitsWhitelist = "0123456789.$:/- ";

namespace {

double scoreToConfidence(double score, double bump, double cap) {
  return std::max(0.0, std::min(cap, score * 100.0 + bump));
}

int modeNumber(PageSegMode mode) {
  return static_cast<int>(mode);
}

} // namespace

GrayImage cropTop(const GrayImage& image, double fraction) {
  GrayImage out;
  if (image.empty()) return out;
  out.width = image.width;
  out.height = std::max(1, static_cast<int>(image.height * fraction));
  out.height = std::min(out.height, image.height);
  out.pixels.assign(image.pixels.begin(), image.pixels.begin() + static_cast<size_t>(out.width) * out.height);
  return out;
}

GrayImage cropRight(const GrayImage& image, double fraction) {
  GrayImage out;
  if (image.empty()) return out;
  int x1 = std::max(0, static_cast<int>(image.width * (1.0 - fraction)));
  x1 = std::min(x1, image.width - 1);
  out.width = image.width - x1;
  out.height = image.height;
  out.pixels.reserve(static_cast<size_t>(out.width) * out.height);
  for (int y = 0; y < image.height; ++y) {
    auto row = image.pixels.begin() + static_cast<size_t>(y) * image.width;
    out.pixels.insert(out.pixels.end(), row + x1, row + image.width);
  }
  return out;
}

double textQualityScore(const std::string& text) {
  std::string t = trim(text);
  if (t.empty()) return 0.0;

  double length = static_cast<double>(t.size());
  double density = static_cast<double>(countAlpha(t) + countDigits(t)) / length;
  std::istringstream iss(t);
  std::string tok;
  int tokens = 0;
  while (iss >> tok) tokens++;

  double score = 0.0;
  score += std::min(0.45, (length / 600.0) * 0.45);
  score += std::min(0.20, density * 0.20);
  score += std::min(0.10, (tokens / 80.0) * 0.10);
  if (hasTotalOrTaxKeyword(t)) score += 0.15;
  if (hasMoneyShape(t)) score += 0.10;
  return clamp01(score);
}

bool looksLikeTotalsMissing(const std::string& text) {
  if (trim(text).empty()) return true;
  return hasTotalOrTaxKeyword(text) && !hasMoneyShape(text);
}

bool looksLikeVendorLettersMissing(const std::string& text) {
  auto lines = splitLines(text);
  std::string top = trim(joinLines(lines, " ", 0, 6));
  if (top.size() < 10) return true;
  int alpha = countAlpha(top);
  int digit = countDigits(top);
  return alpha < 6 || (digit > alpha * 2 && digit > 8);
}

OcrOrchestrator::OcrOrchestrator(OcrEngine& engine, ImagePreprocessor& preprocessor, const OcrSettings& settings)
  : engine_(engine), preprocessor_(preprocessor), settings_(settings) {}

void OcrOrchestrator::addVariant(std::vector<NamedImage>& out, const char* name, const GrayImage& image,
                                 ImageVariant variant) {
  try {
    out.emplace_back(name, preprocessor_.makeVariant(image, variant));
  } catch (const std::exception& e) {
    logger()->warn("image variant '{}' failed: {}", name, e.what());
  }
}

OcrOrchestrator::PassOutcome OcrOrchestrator::bestOf(const std::vector<NamedImage>& variants,
                                                     const std::vector<PageSegMode>& modes,
                                                     const std::string& whitelist, const std::string& language,
                                                     const std::string& tag) {
  PassOutcome best;
  best.source = tag + "_none";
  double bestScore = -1.0;
  std::string bestRaw;

  for (const auto& [name, image] : variants) {
    if (image.empty()) continue;
    for (PageSegMode mode : modes) {
      std::string raw;
      try {
        raw = engine_.recognize(image, OcrRequest{language, mode, whitelist});
      } catch (const std::exception& e) {
        logger()->warn("OCR attempt {}_{}_psm{} failed: {}", tag, name, modeNumber(mode), e.what());
      }
      double score = textQualityScore(raw);
      std::string source = tag + "_" + name + "_psm" + std::to_string(modeNumber(mode)) + (whitelist.empty() ? "" : "_wl");
      logger()->debug("OCR attempt {} score {:.3f}", source, score);
      if (score > bestScore) {
        bestScore = score;
        bestRaw = raw;
        best.source = source;
      }
      if (bestScore >= settings_.earlyExitScore) {
        best.text = normalizeText(bestRaw);
        best.score = bestScore;
        return best;
      }
    }
  }
  best.text = normalizeText(bestRaw);
  best.score = std::max(bestScore, 0.0);
  return best;
}

OcrResult OcrOrchestrator::recognizeImage(const std::vector<std::uint8_t>& bytes, const std::string& language,
                                          const std::string& tag) {
  OcrResult result;
  PreparedImage prepared;
  try {
    prepared = preprocessor_.prepare(bytes);
  } catch (const std::exception& e) {
    logger()->warn("image load failed: {}", e.what());
    result.sourceTag = "image_load_failed";
    return result;
  }
  if (prepared.image.empty()) {
    result.sourceTag = "image_load_failed";
    return result;
  }

  const GrayImage& page = prepared.image;
  std::vector<std::string> sources;
  if (prepared.deskewed) sources.push_back("rectify");

  std::vector<NamedImage> fullVariants;
  addVariant(fullVariants, "denoise", page, ImageVariant::Denoised);
  addVariant(fullVariants, "sharp", page, ImageVariant::Sharpened);

  PassOutcome base = bestOf(fullVariants, {PageSegMode::SingleBlock, PageSegMode::SparseText}, "", language,
                            tag + "_base");
  sources.push_back("base:" + base.source);
  std::string merged = base.text;
  double confidence = scoreToConfidence(base.score, 0.0, 100.0);

  auto append = [&](const char* marker, const PassOutcome& pass, const char* label, double bump, double cap) {
    if (pass.text.empty()) return;
    merged += std::string("\n\n") + marker + "\n" + pass.text;
    confidence = std::max(confidence, scoreToConfidence(pass.score, bump, cap));
    sources.push_back(std::string(label) + ":" + pass.source);
  };

  std::vector<NamedImage> vendorVariants;
  addVariant(vendorVariants, "vendor", cropTop(page, settings_.topStripFraction), ImageVariant::VendorStrip);
  append(kVendorPassMarker,
         bestOf(vendorVariants, {PageSegMode::SingleLine, PageSegMode::SingleBlock}, "", language, tag + "_vendor_top"),
         "vendor", 0.0, 92.0);

  GrayImage right = cropRight(page, settings_.rightStripFraction);
  std::vector<NamedImage> mixedVariants;
  addVariant(mixedVariants, "right_mixed", right, ImageVariant::Sharpened);
  PassOutcome mixed =
      bestOf(mixedVariants, {PageSegMode::SingleBlock, PageSegMode::SparseText}, "", language, tag + "_right_mixed");
  append(kTotalsMixedPassMarker, mixed, "right_mixed", 4.0, 94.0);

  bool mixedUseful = !mixed.text.empty() && (hasMoneyShape(mixed.text) || hasTotalOrTaxKeyword(mixed.text));
  if (!mixedUseful) {
    std::vector<NamedImage> digitVariants;
    addVariant(digitVariants, "right_digits", right, ImageVariant::Sharpened);
    append(kTotalsDigitsPassMarker,
           bestOf(digitVariants, {PageSegMode::SingleBlock, PageSegMode::SingleLine}, kDigitsWhitelist, language,
                  tag + "_right_digits"),
           "right_digits", 6.0, 94.0);
  }

  if (looksLikeTotalsMissing(base.text)) {
    append(kNumericPassMarker,
           bestOf(fullVariants, {PageSegMode::SingleBlock, PageSegMode::SparseText}, kDigitsWhitelist, language,
                  tag + "_digits"),
           "digits", 8.0, 94.0);
  }

  if (looksLikeVendorLettersMissing(base.text)) {
    std::vector<NamedImage> softVariants;
    addVariant(softVariants, "soft_full", page, ImageVariant::SoftText);
    append(kSoftTextPassMarker, bestOf(softVariants, {PageSegMode::SingleBlock}, "", language, tag + "_soft_full"),
           "soft", 0.0, 90.0);
  }

  std::string source;
  for (size_t i = 0; i < sources.size(); ++i) source += (i ? "+" : "") + sources[i];

  result.text = normalizeText(merged);
  if (result.text.empty()) {
    result.sourceTag = source + "|empty";
    return result;
  }
  result.confidence = std::max(0.0, std::min(100.0, confidence));
  result.status = statusFromConfidence(result.confidence);
  result.sourceTag = source;
  logger()->debug("OCR {}: confidence {:.1f} via {}", tag, result.confidence, source);
  return result;
}

OcrResult OcrOrchestrator::recognizePages(const std::vector<std::vector<std::uint8_t>>& pages,
                                          const std::string& language) {
  OcrResult result;
  if (pages.empty()) {
    result.sourceTag = "pdf_render_failed";
    return result;
  }

  std::vector<std::string> texts;
  std::vector<std::string> sources;
  double best = 0.0;
  for (size_t i = 0; i < pages.size(); ++i) {
    OcrResult page = recognizeImage(pages[i], language, "page" + std::to_string(i + 1));
    if (page.text.empty()) continue;
    texts.push_back(page.text);
    sources.push_back(page.sourceTag);
    best = std::max(best, page.confidence);
  }
  if (texts.empty()) {
    result.sourceTag = "pdf_ocr_empty";
    return result;
  }

  result.text = joinLines(texts, std::string("\n") + kPageBreakMarker + "\n");
  result.confidence = best;
  result.status = statusFromConfidence(best);
  result.sourceTag = "pdf_ocr:" + joinLines(sources, ",", 0, 3);
  return result;
}
