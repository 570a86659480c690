#include "tool/schema.hpp"

#include <cctype>

namespace cmdbridge::tool {

std::string to_string(ParameterKind kind) {
  switch (kind) {
    case ParameterKind::Positional:
      return "Positional";
    case ParameterKind::ValueFlag:
      return "ValueFlag";
    case ParameterKind::BooleanFlag:
      return "BooleanFlag";
  }
  return "Unknown";
}

const ParameterSpec *ToolSchema::find(const std::string &param_name) const {
  for (const auto &param : parameters) {
    if (param.name == param_name) return &param;
  }
  return nullptr;
}

json build_input_schema(const ToolSchema &schema) {
  json properties = json::object();
  json required = json::array();

  for (const auto &param : schema.parameters) {
    properties[param.name] = json{{"type", param.value_type}, {"description", param.description}};
  }

  // Positionals first, in declared order, then any required flags
  for (const auto &param : schema.parameters) {
    if (param.kind == ParameterKind::Positional) required.push_back(param.name);
  }
  for (const auto &param : schema.parameters) {
    if (param.kind != ParameterKind::Positional && param.required) required.push_back(param.name);
  }

  return json{{"type", "object"}, {"properties", properties}, {"required", required}};
}

json build_tool_descriptor(const ToolSchema &schema) {
  return json{{"name", schema.name}, {"description", schema.description}, {"inputSchema", build_input_schema(schema)}};
}

std::string sanitize_tool_name(const std::string &command) {
  std::string base = command;
  auto slash = base.find_last_of('/');
  if (slash != std::string::npos) {
    base = base.substr(slash + 1);
  }

  std::string name;
  name.reserve(base.size());
  for (char c : base) {
    bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    name += allowed ? c : '_';
  }

  if (name.empty()) name = "tool";
  return name;
}

}  // namespace cmdbridge::tool
