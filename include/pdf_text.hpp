#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Embedded text layer via `pdftotext -layout -nopgbrk`. Throws std::runtime_error
// if pdftotext is missing or fails.
std::string extractPdfText(const std::string& pdfPath);

// PNG bytes of the first `maxPages` pages rendered by `pdftoppm` at `dpi`.
// Throws std::runtime_error if pdftoppm is missing or fails.
std::vector<std::vector<std::uint8_t>> rasterizePdfPages(const std::string& pdfPath, int maxPages, int dpi);

bool isPdfData(const std::vector<std::uint8_t>& bytes);

std::vector<std::uint8_t> readFileBytes(const std::string& path);

// Bytes written to a private temporary file that is removed on destruction.
class ScopedTempFile {
public:
  ScopedTempFile(const std::vector<std::uint8_t>& bytes, const std::string& suffix);
  ~ScopedTempFile();
  ScopedTempFile(const ScopedTempFile&) = delete;
  ScopedTempFile& operator=(const ScopedTempFile&) = delete;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};
