#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cmdbridge::process {

// exit_code reported when the child was killed for exceeding its timeout
constexpr int kTimeoutExitCode = -1;

struct ExecutionResult {
  int exit_code = 0;
  std::string stdout_data;
  std::string stderr_data;
  bool timed_out = false;

  bool ok() const {
    return !timed_out && exit_code == 0;
  }
};

struct ExecOptions {
  std::optional<std::chrono::milliseconds> timeout;  // unset = wait forever
  std::chrono::milliseconds kill_grace{1000};        // SIGTERM -> SIGKILL delay
  std::string working_dir;                           // empty = inherit
};

// Runs a command directly (no shell) with stdin at /dev/null and stdout/stderr
// captured into memory. Blocks until the child exits or the timeout expires;
// the child and its pipes never outlive a run() call.
class Executor {
 public:
  explicit Executor(ExecOptions options = {});

  // Throws SpawnError if the command cannot be started
  ExecutionResult run(const std::string& command, const std::vector<std::string>& args) const;

  const ExecOptions& options() const {
    return options_;
  }

 private:
  ExecOptions options_;
};

}  // namespace cmdbridge::process
