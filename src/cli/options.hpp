#pragma once

#include <string>
#include <vector>

#include "core/config.hpp"

namespace cmdbridge::cli {

constexpr int kExitStartupError = 1;

enum class CliAction { Run, Help, Version };

struct CliOptions {
  CliAction action = CliAction::Run;
  BridgeConfig config;
};

// Parse the bridge's own command line:
//   <command> <description> [--pos-arg SPEC]... [--flag SPEC]... [options]
// Throws SpecParseError for bad parameter specs and UsageError for everything else.
CliOptions parse_options(int argc, char* argv[]);

// Same, with argv[0] already stripped
CliOptions parse_options(const std::vector<std::string>& args);

std::string usage(const std::string& program);

// Split an --extra-args value on whitespace
std::vector<std::string> split_words(const std::string& text);

}  // namespace cmdbridge::cli
