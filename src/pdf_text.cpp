#include "pdf_text.hpp"

#include "logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool commandExists(const std::string& command) {
  std::string test = "command -v " + command + " >/dev/null 2>&1";
  int rc = std::system(test.c_str());
  return rc == 0;
}

std::string runCaptureStdout(const std::string& cmd, const std::string& tool) {
  std::string output;

  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    throw std::runtime_error("Failed to open pipe to " + tool);
  }

  char buffer[4096];
  while (true) {
    size_t n = std::fread(buffer, 1, sizeof(buffer), pipe);
    if (n > 0) output.append(buffer, n);
    if (n < sizeof(buffer)) break;
  }

  int rc = pclose(pipe);
  if (rc != 0) {
    throw std::runtime_error(tool + " returned non-zero exit code");
  }

  return output;
}

void requireTool(const std::string& tool) {
  if (!commandExists(tool)) {
    throw std::runtime_error(
      tool + " not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
}

class ScopedTempDir {
public:
  ScopedTempDir() {
    std::string tmpl = (fs::temp_directory_path() / "receiptextract-XXXXXX").string();
    if (!mkdtemp(tmpl.data())) {
      throw std::runtime_error(std::string("Cannot create temporary directory: ") + std::strerror(errno));
    }
    path_ = tmpl;
  }
  ~ScopedTempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace

std::string extractPdfText(const std::string& pdfPath) {
  requireTool("pdftotext");
  return runCaptureStdout("pdftotext -layout -nopgbrk -q \"" + pdfPath + "\" -", "pdftotext");
}

std::vector<std::vector<std::uint8_t>> rasterizePdfPages(const std::string& pdfPath, int maxPages, int dpi) {
  requireTool("pdftoppm");
  ScopedTempDir dir;
  std::string prefix = dir.path() + "/page";
  std::string cmd = "pdftoppm -q -r " + std::to_string(dpi) + " -png -f 1 -l " + std::to_string(maxPages) +
                    " \"" + pdfPath + "\" \"" + prefix + "\"";
  runCaptureStdout(cmd, "pdftoppm");

  // pdftoppm zero-pads page numbers to a common width, so name order is page order
  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(dir.path())) {
    if (entry.path().extension() == ".png") files.push_back(entry.path());
  }
  std::sort(files.begin(), files.end());

  std::vector<std::vector<std::uint8_t>> pages;
  for (const auto& f : files) pages.push_back(readFileBytes(f.string()));
  logger()->debug("rasterized {} page(s) of {}", pages.size(), pdfPath);
  return pages;
}

bool isPdfData(const std::vector<std::uint8_t>& bytes) {
  static const char magic[] = "%PDF-";
  if (bytes.size() < 5) return false;
  return std::equal(magic, magic + 5, bytes.begin());
}

std::vector<std::uint8_t> readFileBytes(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("Cannot open file: " + path);
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

ScopedTempFile::ScopedTempFile(const std::vector<std::uint8_t>& bytes, const std::string& suffix) {
  std::string tmpl = (fs::temp_directory_path() / ("receiptextract-XXXXXX" + suffix)).string();
  int fd = mkstemps(tmpl.data(), static_cast<int>(suffix.size()));
  if (fd < 0) {
    throw std::runtime_error(std::string("Cannot create temporary file: ") + std::strerror(errno));
  }
  path_ = tmpl;
  size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      int err = errno;
      ::close(fd);
      std::remove(path_.c_str());
      throw std::runtime_error(std::string("Cannot write temporary file: ") + std::strerror(err));
    }
    written += static_cast<size_t>(n);
  }
  ::close(fd);
}

ScopedTempFile::~ScopedTempFile() {
  std::remove(path_.c_str());
}
