#include "leptonica_preprocessor.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

#include <leptonica/allheaders.h>

namespace {

struct PixDeleter {
  void operator()(PIX* pix) const { pixDestroy(&pix); }
};

using PixPtr = std::unique_ptr<PIX, PixDeleter>;

const int kMaxSide = 2000;
const int kMinSide = 1200;
const int kUpscaleTarget = 1400;
const float kMinSkewConfidence = 3.0f;
const float kMinSkewDegrees = 0.1f;

PixPtr checked(PIX* pix, const char* step) {
  if (!pix) throw std::runtime_error(std::string("leptonica: ") + step + " failed");
  return PixPtr(pix);
}

PixPtr toPix(const GrayImage& image) {
  PixPtr pix = checked(pixCreate(image.width, image.height, 8), "pixCreate");
  l_uint32* data = pixGetData(pix.get());
  l_int32 wpl = pixGetWpl(pix.get());
  for (int y = 0; y < image.height; ++y) {
    l_uint32* line = data + y * wpl;
    const std::uint8_t* src = image.pixels.data() + static_cast<size_t>(y) * image.width;
    for (int x = 0; x < image.width; ++x) SET_DATA_BYTE(line, x, src[x]);
  }
  return pix;
}

GrayImage fromPix(PIX* pix) {
  GrayImage image;
  image.width = pixGetWidth(pix);
  image.height = pixGetHeight(pix);
  image.pixels.resize(static_cast<size_t>(image.width) * image.height);
  l_uint32* data = pixGetData(pix);
  l_int32 wpl = pixGetWpl(pix);
  for (int y = 0; y < image.height; ++y) {
    l_uint32* line = data + y * wpl;
    std::uint8_t* dst = image.pixels.data() + static_cast<size_t>(y) * image.width;
    for (int x = 0; x < image.width; ++x) dst[x] = static_cast<std::uint8_t>(GET_DATA_BYTE(line, x));
  }
  return image;
}

// Huge phone photos are scaled down; small scans are scaled up a little.
PixPtr resizeSane(PixPtr pix) {
  int w = pixGetWidth(pix.get());
  int h = pixGetHeight(pix.get());
  int longest = std::max(w, h);
  float scale = 1.0f;
  if (longest > kMaxSide) {
    scale = static_cast<float>(kMaxSide) / longest;
  } else if (longest < kMinSide) {
    scale = static_cast<float>(kUpscaleTarget) / longest;
  }
  if (scale == 1.0f) return pix;
  return checked(pixScale(pix.get(), scale, scale), "pixScale");
}

} // namespace

PreparedImage LeptonicaPreprocessor::prepare(const std::vector<std::uint8_t>& bytes) {
  if (bytes.empty()) throw std::runtime_error("empty image data");
  PixPtr decoded = checked(pixReadMem(bytes.data(), bytes.size()), "pixReadMem");
  PixPtr gray = checked(pixConvertTo8(decoded.get(), 0), "pixConvertTo8");
  gray = resizeSane(std::move(gray));

  PreparedImage prepared;
  l_float32 angle = 0.0f;
  l_float32 conf = 0.0f;
  PixPtr deskewed(pixFindSkewAndDeskew(gray.get(), 2, &angle, &conf));
  if (deskewed && conf >= kMinSkewConfidence && std::fabs(angle) >= kMinSkewDegrees) {
    logger()->debug("deskewed by {:.2f} degrees (confidence {:.1f})", angle, conf);
    prepared.image = fromPix(deskewed.get());
    prepared.deskewed = true;
  } else {
    prepared.image = fromPix(gray.get());
  }
  return prepared;
}

GrayImage LeptonicaPreprocessor::makeVariant(const GrayImage& image, ImageVariant variant) {
  if (image.empty()) throw std::runtime_error("empty image");
  PixPtr src = toPix(image);
  PixPtr out;
  switch (variant) {
    case ImageVariant::Denoised: {
      PixPtr eq = checked(pixEqualizeTRC(nullptr, src.get(), 0.5f, 1), "pixEqualizeTRC");
      out = checked(pixMedianFilter(eq.get(), 3, 3), "pixMedianFilter");
      break;
    }
    case ImageVariant::Sharpened: {
      PixPtr eq = checked(pixEqualizeTRC(nullptr, src.get(), 0.5f, 1), "pixEqualizeTRC");
      out = checked(pixUnsharpMaskingGray(eq.get(), 1, 0.6f), "pixUnsharpMaskingGray");
      break;
    }
    case ImageVariant::VendorStrip: {
      // opening spreads dark strokes back over hairline gaps
      PixPtr eq = checked(pixEqualizeTRC(nullptr, src.get(), 0.5f, 1), "pixEqualizeTRC");
      out = checked(pixOpenGray(eq.get(), 3, 3), "pixOpenGray");
      break;
    }
    case ImageVariant::SoftText: {
      PixPtr smooth = checked(pixBlockconv(src.get(), 1, 1), "pixBlockconv");
      PixPtr eq = checked(pixEqualizeTRC(nullptr, smooth.get(), 0.5f, 1), "pixEqualizeTRC");
      out = checked(pixOpenGray(eq.get(), 3, 3), "pixOpenGray");
      break;
    }
  }
  return fromPix(out.get());
}
