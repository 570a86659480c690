#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "core/config.hpp"
#include "core/types.hpp"
#include "mcp/transport.hpp"
#include "process/executor.hpp"

namespace cmdbridge::mcp {

// Protocol versions this server can speak, oldest first
constexpr const char* kSupportedProtocolVersions[] = {"2024-11-05", "2025-03-26", "2025-06-18"};
constexpr const char* kLatestProtocolVersion = "2025-06-18";

// Consecutive malformed messages tolerated before giving up on the stream
constexpr int kMaxConsecutiveMalformed = 3;

// Process exit codes returned by McpServer::run()
constexpr int kExitClean = 0;
constexpr int kExitDesync = 2;

// Server lifecycle
enum class ServerState { Uninitialized, Ready, Executing, Terminated };

std::string to_string(ServerState state);

std::string negotiate_protocol_version(const std::string& requested);

// Render an execution outcome as the text the agent sees
ToolResult format_execution_result(const process::ExecutionResult& result, std::optional<std::chrono::milliseconds> timeout);

// tools/call result object: {"content": [{"type": "text", ...}], "isError": ...}
json to_call_result(const ToolResult& result);

// MCP server exposing a single wrapped command as a tool. Requests are handled
// strictly one at a time in arrival order.
class McpServer {
 public:
  McpServer(const BridgeConfig& config, Transport& transport);

  // Serve until end of input, shutdown, or desynchronization. Returns the
  // process exit code.
  int run();

  // Handle one raw incoming message
  void handle_message(const std::string& raw);

  // Map, execute and format one tool call
  ToolResult call_tool(const json& arguments) const;

  ServerState state() const {
    return state_;
  }
  int exit_code() const {
    return exit_code_;
  }
  int consecutive_malformed() const {
    return malformed_count_;
  }
  const json& tool_descriptor() const {
    return tool_descriptor_;
  }

 private:
  JsonRpcResponse dispatch(const JsonRpcRequest& req);
  JsonRpcResponse handle_initialize(const JsonRpcRequest& req);
  JsonRpcResponse handle_tools_list(const JsonRpcRequest& req) const;
  JsonRpcResponse handle_tools_call(const JsonRpcRequest& req);
  void handle_notification(const JsonRpcRequest& req);

  void transition(ServerState next);
  void send(const JsonRpcResponse& response);
  void record_malformed(const std::string& reason);

  const BridgeConfig& config_;
  Transport& transport_;
  process::Executor executor_;
  json tool_descriptor_;  // built once, reused for every tools/list

  ServerState state_ = ServerState::Uninitialized;
  int malformed_count_ = 0;
  int exit_code_ = kExitClean;
};

}  // namespace cmdbridge::mcp
