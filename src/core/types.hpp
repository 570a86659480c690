#pragma once

#include <optional>
#include <string>
#include <utility>

namespace cmdbridge {

// Value-or-error holder for expected failures
template <typename T, typename E = std::string>
struct Result {
  std::optional<T> value;
  std::optional<E> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(E e) {
    Result r;
    r.error = std::move(e);
    return r;
  }
};

// Outcome of one tool invocation, as reported back to the agent
struct ToolResult {
  std::string output;
  bool is_error = false;

  static ToolResult success(std::string output) {
    return ToolResult{std::move(output), false};
  }

  static ToolResult error(std::string message) {
    return ToolResult{std::move(message), true};
  }
};

}  // namespace cmdbridge
