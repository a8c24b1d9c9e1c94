#pragma once

#include <cstdint>
#include <vector>

#include "ocr_orchestrator.hpp"

// Leptonica-backed decoding, size normalization, deskew and enhancement.
class LeptonicaPreprocessor : public ImagePreprocessor {
public:
  PreparedImage prepare(const std::vector<std::uint8_t>& bytes) override;
  GrayImage makeVariant(const GrayImage& image, ImageVariant variant) override;
};
