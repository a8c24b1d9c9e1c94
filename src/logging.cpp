#include "logging.hpp"

#include <mutex>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

const char* kLoggerName = "receiptextract";

std::shared_ptr<spdlog::logger> create(const std::string& filePath) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!filePath.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath));
  }
  auto lg = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  lg->set_level(spdlog::level::warn);
  spdlog::register_logger(lg);
  return lg;
}

std::mutex& registryMutex() {
  static std::mutex m;
  return m;
}

} // namespace

void initLogging(const std::string& level, const std::string& filePath) {
  auto lvl = spdlog::level::from_str(level);
  if (lvl == spdlog::level::off && level != "off") {
    throw std::runtime_error("Unknown log level: " + level);
  }
  std::lock_guard<std::mutex> lock(registryMutex());
  // sinks are fixed at construction, so a repeated call rebuilds the logger
  if (spdlog::get(kLoggerName)) spdlog::drop(kLoggerName);
  auto lg = create(filePath);
  lg->set_level(lvl);
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(registryMutex());
  auto lg = spdlog::get(kLoggerName);
  if (!lg) lg = create("");
  return lg;
}
