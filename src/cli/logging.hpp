#pragma once

#include <string>

namespace cmdbridge::cli {

// Route spdlog's default logger to stderr (or a file). stdout carries the
// protocol and must never receive log output.
void init_logging(const std::string& level, const std::string& log_file = "");

}  // namespace cmdbridge::cli
