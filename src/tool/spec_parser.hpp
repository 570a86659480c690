#pragma once

#include <string>
#include <vector>

#include "tool/schema.hpp"

namespace cmdbridge::tool {

// "name description" -> required positional parameter
ParameterSpec parse_positional(const std::string& spec);

// "-f= description" -> value flag, "-f description" -> boolean flag
ParameterSpec parse_flag(const std::string& spec, bool required = false);

// Accumulates parameter specs in declaration order and rejects duplicate names.
// All methods throw SpecParseError on invalid input.
class SpecParser {
 public:
  void add_positional(const std::string& spec);
  void add_flag(const std::string& spec);
  void add_required_flag(const std::string& spec);

  const std::vector<ParameterSpec>& parameters() const {
    return parameters_;
  }

  ToolSchema build(std::string name, std::string description) const;

 private:
  void add(const std::string& spec, ParameterSpec param);

  std::vector<ParameterSpec> parameters_;
};

}  // namespace cmdbridge::tool
