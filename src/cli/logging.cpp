#include "cli/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cmdbridge::cli {

namespace {
constexpr const char *kLoggerName = "cmdbridge";
}

void init_logging(const std::string &level, const std::string &log_file) {
  spdlog::drop(kLoggerName);

  std::shared_ptr<spdlog::logger> logger;
  if (log_file.empty()) {
    logger = spdlog::stderr_color_mt(kLoggerName);
  } else {
    logger = spdlog::basic_logger_mt(kLoggerName, log_file);
  }

  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  logger->set_level(spdlog::level::from_str(level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

}  // namespace cmdbridge::cli
