#include "tool/spec_parser.hpp"

#include <cctype>
#include <utility>

#include "core/errors.hpp"

namespace cmdbridge::tool {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && is_space(s[begin])) ++begin;
  while (end > begin && is_space(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

// Split on the first whitespace run: {head, description}
std::pair<std::string, std::string> split_spec(const std::string &spec) {
  std::string text = trim(spec);

  size_t pos = 0;
  while (pos < text.size() && !is_space(text[pos])) ++pos;

  std::string head = text.substr(0, pos);
  std::string description = trim(text.substr(pos));

  if (head.empty()) {
    throw SpecParseError(spec, "empty name");
  }
  if (description.empty()) {
    throw SpecParseError(spec, "missing description (expected \"<name> <description>\")");
  }
  return {head, description};
}

}  // namespace

ParameterSpec parse_positional(const std::string &spec) {
  auto [name, description] = split_spec(spec);

  ParameterSpec param;
  param.name = std::move(name);
  param.description = std::move(description);
  param.kind = ParameterKind::Positional;
  param.required = true;
  param.value_type = "string";
  return param;
}

ParameterSpec parse_flag(const std::string &spec, bool required) {
  auto [token, description] = split_spec(spec);

  bool takes_value = token.back() == '=';
  if (takes_value) {
    token.pop_back();
  }
  if (token.empty()) {
    throw SpecParseError(spec, "empty flag token");
  }
  if (token.find('=') != std::string::npos) {
    throw SpecParseError(spec, "'=' is only allowed as the last character of the flag token");
  }

  auto first = token.find_first_not_of('-');
  if (first == std::string::npos) {
    throw SpecParseError(spec, "flag token has no name after leading dashes");
  }

  ParameterSpec param;
  param.name = token.substr(first);
  param.description = std::move(description);
  param.kind = takes_value ? ParameterKind::ValueFlag : ParameterKind::BooleanFlag;
  param.cli_token = std::move(token);
  param.required = required;
  param.value_type = takes_value ? "string" : "boolean";
  return param;
}

void SpecParser::add_positional(const std::string &spec) {
  add(spec, parse_positional(spec));
}

void SpecParser::add_flag(const std::string &spec) {
  add(spec, parse_flag(spec, false));
}

void SpecParser::add_required_flag(const std::string &spec) {
  add(spec, parse_flag(spec, true));
}

void SpecParser::add(const std::string &spec, ParameterSpec param) {
  for (const auto &existing : parameters_) {
    if (existing.name == param.name) {
      throw SpecParseError(spec, "parameter '" + param.name + "' is already declared");
    }
  }
  parameters_.push_back(std::move(param));
}

ToolSchema SpecParser::build(std::string name, std::string description) const {
  ToolSchema schema;
  schema.name = std::move(name);
  schema.description = std::move(description);
  schema.parameters = parameters_;
  return schema;
}

}  // namespace cmdbridge::tool
