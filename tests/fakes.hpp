#pragma once

#include "ocr_orchestrator.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

// Engine whose output is decided by a callback; counts calls.
class FakeOcrEngine : public OcrEngine {
public:
  using Script = std::function<std::string(const GrayImage&, const OcrRequest&)>;

  explicit FakeOcrEngine(Script script) : script_(std::move(script)) {}
  explicit FakeOcrEngine(const std::string& text)
    : script_([text](const GrayImage&, const OcrRequest&) { return text; }) {}
  explicit FakeOcrEngine(const char* text) : FakeOcrEngine(std::string(text)) {}

  std::string recognize(const GrayImage& image, const OcrRequest& request) override {
    calls++;
    requests.push_back(request);
    return script_(image, request);
  }

  int calls = 0;
  std::vector<OcrRequest> requests;

private:
  Script script_;
};

// Ignores the bytes and hands back a blank page; variants are the input image.
class FakePreprocessor : public ImagePreprocessor {
public:
  PreparedImage prepare(const std::vector<std::uint8_t>& bytes) override {
    if (failPrepare) throw std::runtime_error("cannot decode image");
    (void)bytes;
    PreparedImage prepared;
    prepared.image.width = 100;
    prepared.image.height = 200;
    prepared.image.pixels.assign(100 * 200, 255);
    prepared.deskewed = deskew;
    return prepared;
  }

  GrayImage makeVariant(const GrayImage& image, ImageVariant variant) override {
    if (failVariant && variant == *failVariant) throw std::runtime_error("variant failed");
    return image;
  }

  bool failPrepare = false;
  bool deskew = false;
  const ImageVariant* failVariant = nullptr;
};

inline std::string autoZoneReceipt() {
  return "AUTOZONE STORE #5432\n"
         "123 MAIN ST\n"
         "DATE 10/02/2026\n"
         "SUBTOTAL 42.00\n"
         "SALES TAX $3.12\n"
         "GRAND TOTAL $45.12\n";
}
