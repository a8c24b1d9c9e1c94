#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

// (Re)builds the "receiptextract" logger: colored stderr output plus an
// optional file sink. logger() creates a stderr-only one on first use.
void initLogging(const std::string& level = "warn", const std::string& filePath = "");

std::shared_ptr<spdlog::logger> logger();
