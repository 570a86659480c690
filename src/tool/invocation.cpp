#include "tool/invocation.hpp"

#include <algorithm>
#include <cctype>

namespace cmdbridge::tool {

std::string to_string(ValueFlagStyle style) {
  switch (style) {
    case ValueFlagStyle::Joined:
      return "joined";
    case ValueFlagStyle::Separate:
      return "separate";
  }
  return "unknown";
}

std::string to_string(MappingErrorKind kind) {
  switch (kind) {
    case MappingErrorKind::MissingRequiredArgument:
      return "MissingRequiredArgument";
    case MappingErrorKind::UnknownArgument:
      return "UnknownArgument";
    case MappingErrorKind::InvalidArgumentType:
      return "InvalidArgumentType";
  }
  return "Unknown";
}

std::string MappingError::message() const {
  return to_string(kind) + ": " + argument;
}

std::string render_value(const json &value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

bool is_truthy(const json &value) {
  if (value.is_boolean()) return value.get<bool>();
  if (value.is_number()) return value != 0;
  if (value.is_string()) {
    std::string s = value.get<std::string>();
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    return s == "true" || s == "1" || s == "yes";
  }
  return false;
}

namespace {

bool is_present(const json &arguments, const std::string &name) {
  auto it = arguments.find(name);
  return it != arguments.end() && !it->is_null();
}

}  // namespace

Result<ArgVector, MappingError> map_invocation(const json &arguments, const ToolSchema &schema, const InvocationOptions &options) {
  using R = Result<ArgVector, MappingError>;

  // 1. Required parameters: positionals first, then required flags
  for (const auto &param : schema.parameters) {
    if (param.kind == ParameterKind::Positional && !is_present(arguments, param.name)) {
      return R::failure({MappingErrorKind::MissingRequiredArgument, param.name});
    }
  }
  for (const auto &param : schema.parameters) {
    if (param.kind != ParameterKind::Positional && param.required && !is_present(arguments, param.name)) {
      return R::failure({MappingErrorKind::MissingRequiredArgument, param.name});
    }
  }

  // 2. Every supplied name must be declared and scalar
  for (auto it = arguments.begin(); it != arguments.end(); ++it) {
    if (schema.find(it.key()) == nullptr) {
      return R::failure({MappingErrorKind::UnknownArgument, it.key()});
    }
    if (it.value().is_object() || it.value().is_array()) {
      return R::failure({MappingErrorKind::InvalidArgumentType, it.key()});
    }
  }

  ArgVector argv;

  // 3. Positionals as bare tokens
  for (const auto &param : schema.parameters) {
    if (param.kind == ParameterKind::Positional) {
      argv.push_back(render_value(arguments.at(param.name)));
    }
  }

  // 4. Flags in declared order
  for (const auto &param : schema.parameters) {
    if (param.kind == ParameterKind::Positional || !is_present(arguments, param.name)) continue;
    const json &value = arguments.at(param.name);

    // Required flags always reach argv, whatever their value
    if (param.kind == ParameterKind::BooleanFlag) {
      if (param.required || is_truthy(value)) argv.push_back(param.cli_token);
      continue;
    }

    std::string rendered = render_value(value);
    if (rendered.empty() && !param.required) continue;

    if (options.value_flag_style == ValueFlagStyle::Joined) {
      argv.push_back(param.cli_token + "=" + rendered);
    } else {
      argv.push_back(param.cli_token);
      argv.push_back(rendered);
    }
  }

  argv.insert(argv.end(), options.extra_args.begin(), options.extra_args.end());
  return R::success(std::move(argv));
}

}  // namespace cmdbridge::tool
