#include "process/executor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include "core/errors.hpp"

namespace cmdbridge::process {

using Clock = std::chrono::steady_clock;

namespace {

// Owns one pipe; both ends are closed on destruction
struct Pipe {
  int read_fd = -1;
  int write_fd = -1;

  Pipe() = default;
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  ~Pipe() {
    close_read();
    close_write();
  }

  bool open(bool cloexec = false) {
    int fds[2];
    if (pipe(fds) != 0) return false;
    read_fd = fds[0];
    write_fd = fds[1];
    if (cloexec) {
      fcntl(read_fd, F_SETFD, FD_CLOEXEC);
      fcntl(write_fd, F_SETFD, FD_CLOEXEC);
    }
    return true;
  }

  void close_read() {
    if (read_fd >= 0) {
      close(read_fd);
      read_fd = -1;
    }
  }

  void close_write() {
    if (write_fd >= 0) {
      close(write_fd);
      write_fd = -1;
    }
  }
};

// Child side: report errno through the status pipe and exit
[[noreturn]] void child_fail(int status_fd) {
  int err = errno;
  ssize_t ignored = write(status_fd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}

int decode_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return status;
}

int wait_blocking(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      spdlog::error("[Exec] waitpid({}) failed: {}", pid, strerror(errno));
      return -1;
    }
  }
  return status;
}

// Poll for exit until the deadline; nullopt if the child is still running
std::optional<int> wait_until(pid_t pid, Clock::time_point deadline) {
  int status = 0;
  while (true) {
    pid_t rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid) return status;
    if (rc < 0 && errno != EINTR) {
      spdlog::error("[Exec] waitpid({}) failed: {}", pid, strerror(errno));
      return -1;
    }
    if (Clock::now() >= deadline) return std::nullopt;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

// SIGTERM the whole process group, escalate to SIGKILL after the grace period
void terminate_group(pid_t pid, std::chrono::milliseconds grace) {
  kill(-pid, SIGTERM);
  if (wait_until(pid, Clock::now() + grace).has_value()) return;

  spdlog::warn("[Exec] pid {} ignored SIGTERM for {} ms, sending SIGKILL", pid, grace.count());
  kill(-pid, SIGKILL);
  wait_blocking(pid);
}

}  // namespace

Executor::Executor(ExecOptions options) : options_(std::move(options)) {}

ExecutionResult Executor::run(const std::string &command, const std::vector<std::string> &args) const {
  Pipe out_pipe;
  Pipe err_pipe;
  Pipe status_pipe;
  if (!out_pipe.open() || !err_pipe.open() || !status_pipe.open(true)) {
    throw SpawnError(command, std::string("pipe: ") + strerror(errno));
  }

  // Build argv before forking
  std::vector<const char *> argv;
  argv.push_back(command.c_str());
  for (const auto &arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    throw SpawnError(command, std::string("fork: ") + strerror(errno));
  }

  if (pid == 0) {
    // Child process
    setpgid(0, 0);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0) child_fail(status_pipe.write_fd);
    dup2(devnull, STDIN_FILENO);
    close(devnull);

    dup2(out_pipe.write_fd, STDOUT_FILENO);
    dup2(err_pipe.write_fd, STDERR_FILENO);
    close(out_pipe.read_fd);
    close(out_pipe.write_fd);
    close(err_pipe.read_fd);
    close(err_pipe.write_fd);
    close(status_pipe.read_fd);

    if (!options_.working_dir.empty() && chdir(options_.working_dir.c_str()) != 0) {
      child_fail(status_pipe.write_fd);
    }

    execvp(command.c_str(), const_cast<char *const *>(argv.data()));
    child_fail(status_pipe.write_fd);
  }

  // Parent process
  setpgid(pid, pid);
  out_pipe.close_write();
  err_pipe.close_write();
  status_pipe.close_write();

  // EOF on the status pipe means exec succeeded
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe.read_fd, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    wait_blocking(pid);
    throw SpawnError(command, strerror(child_errno));
  }

  spdlog::debug("[Exec] Started '{}' with {} args (pid: {})", command, args.size(), pid);

  ExecutionResult result;
  std::optional<Clock::time_point> deadline;
  if (options_.timeout) {
    deadline = Clock::now() + *options_.timeout;
  }

  std::array<char, 4096> buf;
  while (out_pipe.read_fd >= 0 || err_pipe.read_fd >= 0) {
    int wait_ms = -1;
    if (deadline) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
      if (remaining <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining);
    }

    std::array<pollfd, 2> fds{};
    nfds_t nfds = 0;
    if (out_pipe.read_fd >= 0) fds[nfds++] = pollfd{out_pipe.read_fd, POLLIN, 0};
    if (err_pipe.read_fd >= 0) fds[nfds++] = pollfd{err_pipe.read_fd, POLLIN, 0};

    int rc = poll(fds.data(), nfds, wait_ms);
    if (rc < 0) {
      if (errno == EINTR) continue;
      spdlog::error("[Exec] poll failed: {}", strerror(errno));
      break;
    }
    if (rc == 0) continue;

    for (nfds_t i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0) continue;

      bool is_out = fds[i].fd == out_pipe.read_fd;
      ssize_t got = read(fds[i].fd, buf.data(), buf.size());
      if (got > 0) {
        (is_out ? result.stdout_data : result.stderr_data).append(buf.data(), static_cast<size_t>(got));
      } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
        if (is_out) {
          out_pipe.close_read();
        } else {
          err_pipe.close_read();
        }
      }
    }
  }

  // Output is closed; the child may still be running
  if (!result.timed_out && deadline) {
    auto status = wait_until(pid, *deadline);
    if (status) {
      result.exit_code = decode_status(*status);
    } else {
      result.timed_out = true;
    }
  } else if (!result.timed_out) {
    result.exit_code = decode_status(wait_blocking(pid));
  }

  if (result.timed_out) {
    spdlog::warn("[Exec] '{}' (pid: {}) exceeded timeout of {} ms", command, pid, options_.timeout->count());
    terminate_group(pid, options_.kill_grace);
    result.exit_code = kTimeoutExitCode;
  }

  spdlog::debug("[Exec] '{}' finished: exit_code={} timed_out={} stdout={}B stderr={}B", command, result.exit_code, result.timed_out,
                result.stdout_data.size(), result.stderr_data.size());
  return result;
}

}  // namespace cmdbridge::process
