#include "mcp/server.hpp"

#include <spdlog/spdlog.h>

#include "core/errors.hpp"
#include "core/version.hpp"
#include "tool/invocation.hpp"

namespace cmdbridge::mcp {

// ============================================================
// Helpers
// ============================================================

std::string to_string(ServerState state) {
  switch (state) {
    case ServerState::Uninitialized:
      return "Uninitialized";
    case ServerState::Ready:
      return "Ready";
    case ServerState::Executing:
      return "Executing";
    case ServerState::Terminated:
      return "Terminated";
  }
  return "Unknown";
}

std::string negotiate_protocol_version(const std::string &requested) {
  for (const char *version : kSupportedProtocolVersions) {
    if (requested == version) return requested;
  }
  return kLatestProtocolVersion;
}

ToolResult format_execution_result(const process::ExecutionResult &result, std::optional<std::chrono::milliseconds> timeout) {
  std::string output;

  if (result.timed_out) {
    output = "Command timed out";
    if (timeout) output += " after " + std::to_string(timeout->count()) + " ms";
    if (!result.stdout_data.empty()) output += "\n" + result.stdout_data;
    if (!result.stderr_data.empty()) output += "\nSTDERR:\n" + result.stderr_data;
    return ToolResult::error(output);
  }

  output = result.stdout_data;
  if (!result.stderr_data.empty()) {
    output += "\nSTDERR:\n" + result.stderr_data;
  }
  if (result.exit_code != 0) {
    output += "\nExit code: " + std::to_string(result.exit_code);
    return ToolResult::error(output);
  }

  if (output.empty()) output = "(no output)";
  return ToolResult::success(output);
}

json to_call_result(const ToolResult &result) {
  return json{{"content", json::array({json{{"type", "text"}, {"text", result.output}}})}, {"isError", result.is_error}};
}

// ============================================================
// McpServer
// ============================================================

McpServer::McpServer(const BridgeConfig &config, Transport &transport)
    : config_(config), transport_(transport), executor_(config.exec), tool_descriptor_(tool::build_tool_descriptor(config.tool)) {}

int McpServer::run() {
  spdlog::info("[MCP] Serving tool '{}' (command: {}, {} parameters)", config_.tool.name, config_.command, config_.tool.parameters.size());
  for (const auto &param : config_.tool.parameters) {
    spdlog::debug("[MCP]   {} {}{}", tool::to_string(param.kind), param.name, param.required ? " (required)" : "");
  }

  while (state_ != ServerState::Terminated) {
    auto raw = transport_.read_message();
    if (!raw) {
      spdlog::info("[MCP] End of input (transport {}), shutting down", to_string(transport_.state()));
      transition(ServerState::Terminated);
      break;
    }
    handle_message(*raw);
  }

  spdlog::info("[MCP] Terminated with exit code {}", exit_code_);
  return exit_code_;
}

void McpServer::handle_message(const std::string &raw) {
  if (state_ == ServerState::Terminated) return;

  auto parsed = parse_request(raw);
  if (parsed.failed()) {
    send(*parsed.error);
    record_malformed(parsed.error->error_message());
    return;
  }

  const JsonRpcRequest &req = *parsed.value;
  if (req.is_notification()) {
    malformed_count_ = 0;
    handle_notification(req);
    return;
  }

  spdlog::debug("[MCP] <- {} (id: {})", req.method, req.id->dump());
  auto response = dispatch(req);

  bool unknown_method = response.error.has_value() && (*response.error)["code"] == error_code::kMethodNotFound;
  send(response);
  if (unknown_method) {
    record_malformed("unknown method '" + req.method + "'");
  } else {
    malformed_count_ = 0;
  }
}

JsonRpcResponse McpServer::dispatch(const JsonRpcRequest &req) {
  const json &id = *req.id;

  if (req.method == "initialize") {
    return handle_initialize(req);
  }
  if (req.method == "ping") {
    return JsonRpcResponse::success(id, json::object());
  }
  if (req.method == "shutdown") {
    spdlog::info("[MCP] Shutdown requested");
    transition(ServerState::Terminated);
    return JsonRpcResponse::success(id, json::object());
  }

  if (req.method == "tools/list" || req.method == "tools/call") {
    if (state_ == ServerState::Uninitialized) {
      return JsonRpcResponse::failure(id, error_code::kServerNotInitialized, "Server not initialized");
    }
    return req.method == "tools/list" ? handle_tools_list(req) : handle_tools_call(req);
  }

  return JsonRpcResponse::failure(id, error_code::kMethodNotFound, "Method not found: " + req.method);
}

JsonRpcResponse McpServer::handle_initialize(const JsonRpcRequest &req) {
  std::string requested;
  if (req.params.is_object()) {
    auto version = req.params.find("protocolVersion");
    if (version != req.params.end() && version->is_string()) {
      requested = version->get<std::string>();
    }

    auto client_info = req.params.find("clientInfo");
    if (client_info != req.params.end() && client_info->is_object()) {
      spdlog::info("[MCP] Client: {} v{}", client_info->value("name", "unknown"), client_info->value("version", "unknown"));
    }
  }

  std::string negotiated = negotiate_protocol_version(requested);
  if (negotiated != requested) {
    spdlog::info("[MCP] Client requested protocol '{}', offering '{}'", requested, negotiated);
  }

  if (state_ == ServerState::Uninitialized) {
    transition(ServerState::Ready);
  } else {
    spdlog::warn("[MCP] Repeated initialize request");
  }

  json result = {
      {"protocolVersion", negotiated},
      {"capabilities", {{"tools", {{"listChanged", false}}}}},
      {"serverInfo", {{"name", kServerName}, {"version", kVersion}}},
  };
  return JsonRpcResponse::success(*req.id, std::move(result));
}

JsonRpcResponse McpServer::handle_tools_list(const JsonRpcRequest &req) const {
  return JsonRpcResponse::success(*req.id, json{{"tools", json::array({tool_descriptor_})}});
}

JsonRpcResponse McpServer::handle_tools_call(const JsonRpcRequest &req) {
  const json &id = *req.id;

  if (!req.params.is_object()) {
    return JsonRpcResponse::failure(id, error_code::kInvalidParams, "params must be an object");
  }

  auto name = req.params.find("name");
  if (name == req.params.end() || !name->is_string()) {
    return JsonRpcResponse::failure(id, error_code::kInvalidParams, "Missing tool name");
  }
  if (*name != config_.tool.name) {
    return JsonRpcResponse::failure(id, error_code::kInvalidParams, "Unknown tool: " + name->get<std::string>());
  }

  json arguments = json::object();
  auto args_it = req.params.find("arguments");
  if (args_it != req.params.end() && !args_it->is_null()) {
    if (!args_it->is_object()) {
      return JsonRpcResponse::failure(id, error_code::kInvalidParams, "arguments must be an object");
    }
    arguments = *args_it;
  }

  transition(ServerState::Executing);
  ToolResult result = call_tool(arguments);
  transition(ServerState::Ready);

  return JsonRpcResponse::success(id, to_call_result(result));
}

ToolResult McpServer::call_tool(const json &arguments) const {
  auto mapped = tool::map_invocation(arguments, config_.tool, config_.invocation);
  if (mapped.failed()) {
    spdlog::warn("[MCP] Rejected call to '{}': {}", config_.tool.name, mapped.error->message());
    return ToolResult::error(mapped.error->message());
  }

  try {
    auto result = executor_.run(config_.command, *mapped.value);
    return format_execution_result(result, executor_.options().timeout);
  } catch (const SpawnError &e) {
    spdlog::error("[Exec] {}", e.what());
    return ToolResult::error(e.what());
  }
}

void McpServer::handle_notification(const JsonRpcRequest &req) {
  if (req.method == "notifications/initialized") {
    spdlog::debug("[MCP] Client finished initialization");
  } else {
    spdlog::debug("[MCP] Ignoring notification '{}'", req.method);
  }
}

void McpServer::transition(ServerState next) {
  if (next == state_) return;
  spdlog::debug("[MCP] State {} -> {}", to_string(state_), to_string(next));
  state_ = next;
}

void McpServer::send(const JsonRpcResponse &response) {
  if (!transport_.write_message(response.to_json())) {
    spdlog::warn("[MCP] Client went away, shutting down");
    transition(ServerState::Terminated);
  }
}

void McpServer::record_malformed(const std::string &reason) {
  ++malformed_count_;
  spdlog::warn("[MCP] Malformed message ({}/{}): {}", malformed_count_, kMaxConsecutiveMalformed, reason);

  if (malformed_count_ >= kMaxConsecutiveMalformed) {
    spdlog::error("[MCP] {} consecutive malformed messages, input stream is desynchronized", malformed_count_);
    transition(ServerState::Terminated);
    exit_code_ = kExitDesync;
  }
}

}  // namespace cmdbridge::mcp
