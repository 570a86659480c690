#pragma once

#include <stdexcept>
#include <string>

namespace cmdbridge {

// Base class for every exception thrown by cmdbridge
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// Invalid --pos-arg / --flag argument; fatal at startup
class SpecParseError : public Error {
 public:
  SpecParseError(const std::string& spec, const std::string& reason)
      : Error("Invalid argument spec '" + spec + "': " + reason), spec_(spec) {}

  const std::string& spec() const noexcept {
    return spec_;
  }

 private:
  std::string spec_;
};

// Malformed bridge command line (unknown option, missing value, bad number)
class UsageError : public Error {
 public:
  explicit UsageError(const std::string& message) : Error(message) {}
};

// The wrapped command could not be started
class SpawnError : public Error {
 public:
  SpawnError(const std::string& command, const std::string& reason)
      : Error("Failed to start command '" + command + "': " + reason), command_(command), reason_(reason) {}

  const std::string& command() const noexcept {
    return command_;
  }
  const std::string& reason() const noexcept {
    return reason_;
  }

 private:
  std::string command_;
  std::string reason_;
};

}  // namespace cmdbridge
