#include "tesseract_engine.hpp"

#include "logging.hpp"

#include <stdexcept>

#include <tesseract/baseapi.h>

TesseractEngine::TesseractEngine(const std::string& language, const std::string& tessdataPath, int dpi)
  : api_(std::make_unique<tesseract::TessBaseAPI>()), tessdataPath_(tessdataPath), dpi_(dpi) {
  init(language);
}

TesseractEngine::~TesseractEngine() {
  api_->End();
}

void TesseractEngine::init(const std::string& language) {
  const char* datapath = tessdataPath_.empty() ? nullptr : tessdataPath_.c_str();
  if (api_->Init(datapath, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
    language_.clear();
    throw std::runtime_error("Could not initialize tesseract with language '" + language + "'");
  }
  api_->SetVariable("preserve_interword_spaces", "1");
  api_->SetVariable("tessedit_do_invert", "0");
  language_ = language;
  logger()->info("tesseract {} initialized for '{}'", api_->Version(), language);
}

std::string TesseractEngine::recognize(const GrayImage& image, const OcrRequest& request) {
  if (image.empty()) return "";
  const std::string& language = request.language.empty() ? language_ : request.language;
  if (language != language_) init(language);

  api_->SetPageSegMode(static_cast<tesseract::PageSegMode>(static_cast<int>(request.mode)));
  if (!api_->SetVariable("tessedit_char_whitelist", request.whitelist.c_str())) {
    throw std::runtime_error("tesseract rejected the character whitelist");
  }
  api_->SetImage(image.pixels.data(), image.width, image.height, 1, image.width);
  api_->SetSourceResolution(dpi_);

  std::unique_ptr<char[]> text{api_->GetUTF8Text()};
  api_->Clear();
  if (!text) throw std::runtime_error("tesseract returned no text");
  return std::string(text.get());
}
