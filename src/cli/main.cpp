#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>

#include "cli/logging.hpp"
#include "cli/options.hpp"
#include "core/errors.hpp"
#include "core/version.hpp"
#include "mcp/server.hpp"
#include "mcp/transport.hpp"

using namespace cmdbridge;

int main(int argc, char* argv[]) {
  // A vanished client must surface as a failed write, not kill the bridge
  std::signal(SIGPIPE, SIG_IGN);

  const std::string program = argc > 0 ? argv[0] : kServerName;

  cli::CliOptions options;
  try {
    options = cli::parse_options(argc, argv);
  } catch (const Error& e) {
    cli::init_logging("warn");
    spdlog::error("[CLI] {}", e.what());
    std::cerr << cli::usage(program);
    return cli::kExitStartupError;
  }

  if (options.action == cli::CliAction::Help) {
    std::cout << cli::usage(program);
    return 0;
  }
  if (options.action == cli::CliAction::Version) {
    std::cout << kServerName << " " << kVersion << "\n";
    return 0;
  }

  const BridgeConfig& config = options.config;
  try {
    cli::init_logging(config.log_level, config.log_file);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "Failed to open log file '" << config.log_file << "': " << e.what() << "\n";
    return cli::kExitStartupError;
  }

  spdlog::debug("[CLI] tool '{}' wraps '{}' ({} extra args, value flags {})", config.tool.name, config.command,
                config.invocation.extra_args.size(), tool::to_string(config.invocation.value_flag_style));

  mcp::StdioTransport transport(std::cin, std::cout);
  mcp::McpServer server(config, transport);
  int exit_code = server.run();

  spdlog::shutdown();
  return exit_code;
}
