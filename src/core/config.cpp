#include "core/config.hpp"

#include <array>
#include <cmath>
#include <cstdlib>

#include "core/errors.hpp"

namespace cmdbridge {

namespace {

constexpr std::array<const char *, 6> kLogLevels = {"trace", "debug", "info", "warn", "error", "off"};

}  // namespace

BridgeConfig BridgeConfig::load_default() {
  BridgeConfig config;

  if (const char *timeout = std::getenv("CMDBRIDGE_TIMEOUT")) {
    config.exec.timeout = parse_timeout_seconds(timeout, "CMDBRIDGE_TIMEOUT");
  }
  if (const char *level = std::getenv("CMDBRIDGE_LOG_LEVEL")) {
    config.log_level = validate_log_level(level, "CMDBRIDGE_LOG_LEVEL");
  }

  return config;
}

std::chrono::milliseconds parse_timeout_seconds(const std::string &value, const std::string &source) {
  double seconds = 0;
  size_t consumed = 0;
  try {
    seconds = std::stod(value, &consumed);
  } catch (const std::exception &) {
    throw UsageError(source + ": '" + value + "' is not a number of seconds");
  }
  if (consumed != value.size() || !std::isfinite(seconds) || seconds <= 0) {
    throw UsageError(source + ": timeout must be a positive number of seconds, got '" + value + "'");
  }
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(std::ceil(seconds * 1000.0)));
}

std::string validate_log_level(const std::string &value, const std::string &source) {
  for (const char *level : kLogLevels) {
    if (value == level) return value;
  }
  throw UsageError(source + ": unknown log level '" + value + "' (expected trace|debug|info|warn|error|off)");
}

}  // namespace cmdbridge
