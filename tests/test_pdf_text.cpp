#include <catch2/catch_all.hpp>

#include "pdf_text.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

TEST_CASE("PDF magic detection", "[pdf]") {
  REQUIRE(isPdfData({'%', 'P', 'D', 'F', '-', '1', '.', '7'}));
  REQUIRE_FALSE(isPdfData({'%', 'P', 'D'}));
  REQUIRE_FALSE(isPdfData({0x89, 'P', 'N', 'G', '\r', '\n'}));
}

TEST_CASE("temporary files hold the bytes and disappear", "[pdf]") {
  std::vector<std::uint8_t> bytes = {'%', 'P', 'D', 'F', '-', 0, 1, 2, 255};
  std::string path;
  {
    ScopedTempFile tmp(bytes, ".pdf");
    path = tmp.path();
    REQUIRE(path.size() > 4);
    REQUIRE(path.substr(path.size() - 4) == ".pdf");
    REQUIRE(readFileBytes(path) == bytes);
  }
  REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("missing files are reported", "[pdf]") {
  REQUIRE_THROWS_AS(readFileBytes("/nonexistent/receipt.png"), std::runtime_error);
}
