#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cmdbridge::tool {

using json = nlohmann::json;

// How a declared parameter reaches the wrapped command's argv
enum class ParameterKind { Positional, ValueFlag, BooleanFlag };

std::string to_string(ParameterKind kind);

struct ParameterSpec {
  std::string name;
  std::string description;
  ParameterKind kind = ParameterKind::Positional;
  std::string cli_token;  // "-resize"; empty for positionals
  bool required = true;
  std::string value_type = "string";  // "string" or "boolean"
};

// The single tool exposed by the bridge. Built once at startup.
struct ToolSchema {
  std::string name;
  std::string description;
  std::vector<ParameterSpec> parameters;  // declaration order

  const ParameterSpec* find(const std::string& param_name) const;
};

// JSON Schema object for the tool's arguments ("inputSchema")
json build_input_schema(const ToolSchema& schema);

// Full tools/list entry: name, description, inputSchema
json build_tool_descriptor(const ToolSchema& schema);

// Derive a protocol-safe tool name from a command path: basename, [A-Za-z0-9_-] only
std::string sanitize_tool_name(const std::string& command);

}  // namespace cmdbridge::tool
