#pragma once

#include <chrono>
#include <string>

#include "process/executor.hpp"
#include "tool/invocation.hpp"
#include "tool/schema.hpp"

namespace cmdbridge {

// Everything the bridge needs at runtime. Built once at startup, then only
// read through const references.
struct BridgeConfig {
  std::string command;                // wrapped program (argv[0] of every call)
  tool::ToolSchema tool;              // the single exposed tool
  tool::InvocationOptions invocation;  // value-flag style + extra args
  process::ExecOptions exec;          // timeout, kill grace, working dir

  std::string log_level = "warn";
  std::string log_file;  // empty = stderr

  // Defaults with environment overrides applied:
  //   CMDBRIDGE_TIMEOUT    per-call timeout in seconds
  //   CMDBRIDGE_LOG_LEVEL  trace|debug|info|warn|error|off
  static BridgeConfig load_default();
};

// "30", "0.5" -> milliseconds; throws UsageError on anything else
std::chrono::milliseconds parse_timeout_seconds(const std::string& value, const std::string& source);

// Throws UsageError unless value names a known log level
std::string validate_log_level(const std::string& value, const std::string& source);

}  // namespace cmdbridge
