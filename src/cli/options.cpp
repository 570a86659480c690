#include "cli/options.hpp"

#include <set>
#include <sstream>

#include "core/errors.hpp"
#include "tool/spec_parser.hpp"

namespace cmdbridge::cli {

namespace {

// Every bridge option takes exactly one value
const std::set<std::string> kValueOptions = {"--pos-arg", "--flag",       "--required-flag", "--extra-args",
                                             "--name",    "--timeout",    "--kill-grace",    "--value-flag-style",
                                             "--cwd",     "--log-level",  "--log-file"};

bool is_valid_tool_name(const std::string &name) {
  if (name.empty() || name.size() > 128) return false;
  for (char c : name) {
    bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!allowed) return false;
  }
  return true;
}

std::chrono::milliseconds parse_grace_ms(const std::string &value) {
  long long ms = 0;
  size_t consumed = 0;
  try {
    ms = std::stoll(value, &consumed);
  } catch (const std::exception &) {
    throw UsageError("--kill-grace: '" + value + "' is not a number of milliseconds");
  }
  if (consumed != value.size() || ms < 0) {
    throw UsageError("--kill-grace: expected a non-negative number of milliseconds, got '" + value + "'");
  }
  return std::chrono::milliseconds(ms);
}

tool::ValueFlagStyle parse_value_flag_style(const std::string &value) {
  if (value == "joined") return tool::ValueFlagStyle::Joined;
  if (value == "separate") return tool::ValueFlagStyle::Separate;
  throw UsageError("--value-flag-style: expected 'joined' or 'separate', got '" + value + "'");
}

}  // namespace

std::vector<std::string> split_words(const std::string &text) {
  std::vector<std::string> words;
  std::istringstream stream(text);
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

CliOptions parse_options(int argc, char *argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_options(args);
}

CliOptions parse_options(const std::vector<std::string> &args) {
  CliOptions options;

  for (const auto &arg : args) {
    if (arg == "--help" || arg == "-h") {
      options.action = CliAction::Help;
      return options;
    }
    if (arg == "--version") {
      options.action = CliAction::Version;
      return options;
    }
  }

  if (args.size() < 2) {
    throw UsageError("Expected <command> <description>");
  }

  BridgeConfig config = BridgeConfig::load_default();
  config.command = args[0];
  std::string description = args[1];
  if (config.command.empty() || config.command.rfind("--", 0) == 0) {
    throw UsageError("First argument must be the command to wrap, got '" + config.command + "'");
  }
  if (description.empty() || kValueOptions.count(description) != 0) {
    throw UsageError("Missing tool description after the command");
  }

  tool::SpecParser parser;
  std::string tool_name;

  for (size_t i = 2; i < args.size(); ++i) {
    const std::string &opt = args[i];

    if (opt == "--tool") {
      throw UsageError("--tool: only one tool per bridge is supported; run one cmdbridge per tool");
    }

    if (kValueOptions.count(opt) == 0) {
      throw UsageError(opt.rfind("-", 0) == 0 ? "Unknown option: " + opt : "Unexpected argument: " + opt);
    }
    if (i + 1 >= args.size()) {
      throw UsageError("Missing value for " + opt);
    }

    if (opt == "--pos-arg") {
      parser.add_positional(args[++i]);
    } else if (opt == "--flag") {
      parser.add_flag(args[++i]);
    } else if (opt == "--required-flag") {
      parser.add_required_flag(args[++i]);
    } else if (opt == "--extra-args") {
      auto words = split_words(args[++i]);
      config.invocation.extra_args.insert(config.invocation.extra_args.end(), words.begin(), words.end());
    } else if (opt == "--name") {
      tool_name = args[++i];
      if (!is_valid_tool_name(tool_name)) {
        throw UsageError("--name: '" + tool_name + "' must be 1-128 characters of [A-Za-z0-9_-]");
      }
    } else if (opt == "--timeout") {
      config.exec.timeout = parse_timeout_seconds(args[++i], "--timeout");
    } else if (opt == "--kill-grace") {
      config.exec.kill_grace = parse_grace_ms(args[++i]);
    } else if (opt == "--value-flag-style") {
      config.invocation.value_flag_style = parse_value_flag_style(args[++i]);
    } else if (opt == "--cwd") {
      config.exec.working_dir = args[++i];
    } else if (opt == "--log-level") {
      config.log_level = validate_log_level(args[++i], "--log-level");
    } else if (opt == "--log-file") {
      config.log_file = args[++i];
    }
  }

  if (tool_name.empty()) {
    tool_name = tool::sanitize_tool_name(config.command);
  }
  config.tool = parser.build(tool_name, description);

  options.config = std::move(config);
  return options;
}

std::string usage(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program << " <command> <description> [options]\n"
      << "\n"
      << "Expose <command> as a single MCP tool over stdio.\n"
      << "\n"
      << "Parameters:\n"
      << "  --pos-arg \"name description\"        positional argument (required)\n"
      << "  --flag \"-f= description\"            optional flag taking a value\n"
      << "  --flag \"-f description\"             optional boolean flag\n"
      << "  --required-flag \"-f= description\"   required flag\n"
      << "\n"
      << "Options:\n"
      << "  --extra-args \"a b\"                  arguments appended to every call\n"
      << "  --name NAME                         tool name (default: command basename)\n"
      << "  --timeout SECONDS                   per-call timeout (env: CMDBRIDGE_TIMEOUT)\n"
      << "  --kill-grace MS                     SIGTERM to SIGKILL delay (default: 1000)\n"
      << "  --value-flag-style joined|separate  '-f=value' or '-f value' (default: joined)\n"
      << "  --cwd DIR                           working directory for the command\n"
      << "  --log-level LEVEL                   trace|debug|info|warn|error|off (env: CMDBRIDGE_LOG_LEVEL)\n"
      << "  --log-file PATH                     log to PATH instead of stderr\n"
      << "  --help, --version\n";
  return out.str();
}

}  // namespace cmdbridge::cli
