#pragma once

#include <memory>
#include <string>

#include "ocr_orchestrator.hpp"

namespace tesseract {
class TessBaseAPI;
}

// OcrEngine over a Tesseract LSTM handle. The handle is re-initialized when a
// request asks for a different language. Not thread-safe.
class TesseractEngine : public OcrEngine {
public:
  // Throws std::runtime_error when the language data cannot be loaded.
  TesseractEngine(const std::string& language, const std::string& tessdataPath = "", int dpi = 300);
  ~TesseractEngine() override;

  TesseractEngine(const TesseractEngine&) = delete;
  TesseractEngine& operator=(const TesseractEngine&) = delete;

  std::string recognize(const GrayImage& image, const OcrRequest& request) override;

private:
  void init(const std::string& language);

  std::unique_ptr<tesseract::TessBaseAPI> api_;
  std::string language_;
  std::string tessdataPath_;
  int dpi_;
};
