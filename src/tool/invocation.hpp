#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "tool/schema.hpp"

namespace cmdbridge::tool {

using json = nlohmann::json;
using ArgVector = std::vector<std::string>;

// How a value flag and its value are laid out in argv
enum class ValueFlagStyle {
  Joined,    // "-resize=50%"
  Separate,  // "-resize" "50%"
};

std::string to_string(ValueFlagStyle style);

enum class MappingErrorKind { MissingRequiredArgument, UnknownArgument, InvalidArgumentType };

std::string to_string(MappingErrorKind kind);

struct MappingError {
  MappingErrorKind kind;
  std::string argument;

  // "UnknownArgument: foo"
  std::string message() const;
};

struct InvocationOptions {
  ValueFlagStyle value_flag_style = ValueFlagStyle::Joined;
  std::vector<std::string> extra_args;  // appended after all flags
};

// Translate a tools/call argument object into the wrapped command's argv.
// Positionals come first in declared order, then flags in declared order.
Result<ArgVector, MappingError> map_invocation(const json& arguments, const ToolSchema& schema, const InvocationOptions& options = {});

// Opaque string rendering of a scalar argument value
std::string render_value(const json& value);

// Truthiness of a boolean flag value
bool is_truthy(const json& value);

}  // namespace cmdbridge::tool
