#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "process/executor.hpp"

using namespace cmdbridge;
using namespace cmdbridge::process;
namespace fs = std::filesystem;

// ============================================================
// ExecutorTest — 子进程执行
// ============================================================

TEST(ExecutorTest, CapturesStdout) {
  Executor executor;
  auto result = executor.run("echo", {"hello", "world"});

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.stdout_data, "hello world\n");
  EXPECT_TRUE(result.stderr_data.empty());
  EXPECT_TRUE(result.ok());
}

TEST(ExecutorTest, CapturesStderrSeparately) {
  Executor executor;
  auto result = executor.run("sh", {"-c", "echo out; echo err >&2"});

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_data, "out\n");
  EXPECT_EQ(result.stderr_data, "err\n");
}

TEST(ExecutorTest, ReportsNonZeroExit) {
  Executor executor;
  auto result = executor.run("sh", {"-c", "exit 3"});

  EXPECT_EQ(result.exit_code, 3);
  EXPECT_FALSE(result.timed_out);
  EXPECT_FALSE(result.ok());
}

TEST(ExecutorTest, ArgumentsAreNotShellInterpreted) {
  Executor executor;
  // printf 原样打印参数，$HOME 和 ; 不应被展开或解释
  auto result = executor.run("printf", {"%s|", "$HOME", "a;b", "*"});

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_data, "$HOME|a;b|*|");
}

TEST(ExecutorTest, StdinIsDevNull) {
  Executor executor;
  auto result = executor.run("cat", {});

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_TRUE(result.stdout_data.empty());
}

TEST(ExecutorTest, LargeOutputOnBothStreams) {
  Executor executor;
  // 两个管道同时写满也不能死锁
  auto result = executor.run("sh", {"-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; echo err$i >&2; i=$((i+1)); done"});

  EXPECT_EQ(result.exit_code, 0);
  EXPECT_GT(result.stdout_data.size(), 100000u);
  EXPECT_GT(result.stderr_data.size(), 100000u);
}

TEST(ExecutorTest, SignalledChildReports128PlusSignal) {
  Executor executor;
  auto result = executor.run("sh", {"-c", "kill -9 $$"});

  EXPECT_EQ(result.exit_code, 128 + 9);
  EXPECT_FALSE(result.timed_out);
}

TEST(ExecutorTest, CommandNotFoundThrowsSpawnError) {
  Executor executor;

  try {
    executor.run("/nonexistent/definitely-not-a-command", {});
    FAIL() << "expected SpawnError";
  } catch (const SpawnError &e) {
    EXPECT_EQ(e.command(), "/nonexistent/definitely-not-a-command");
    EXPECT_FALSE(e.reason().empty());
  }
}

TEST(ExecutorTest, PermissionDeniedThrowsSpawnError) {
  auto path = fs::temp_directory_path() / "cmdbridge_not_executable.txt";
  {
    std::FILE *f = std::fopen(path.c_str(), "w");
    ASSERT_NE(f, nullptr);
    std::fputs("not a program\n", f);
    std::fclose(f);
  }
  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write);

  Executor executor;
  EXPECT_THROW(executor.run(path.string(), {}), SpawnError);

  std::error_code ec;
  fs::remove(path, ec);
}

TEST(ExecutorTest, WorkingDirectory) {
  auto dir = fs::canonical(fs::temp_directory_path());

  ExecOptions options;
  options.working_dir = dir.string();
  Executor executor(options);

  auto result = executor.run("pwd", {});
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_data, dir.string() + "\n");
}

TEST(ExecutorTest, MissingWorkingDirectoryThrowsSpawnError) {
  ExecOptions options;
  options.working_dir = "/nonexistent/dir/for/cmdbridge";
  Executor executor(options);

  EXPECT_THROW(executor.run("pwd", {}), SpawnError);
}

// ============================================================
// ExecutorTimeoutTest — 超时处理
// ============================================================

TEST(ExecutorTimeoutTest, FastCommandWithinTimeout) {
  ExecOptions options;
  options.timeout = std::chrono::milliseconds(5000);
  Executor executor(options);

  auto result = executor.run("echo", {"quick"});

  EXPECT_FALSE(result.timed_out);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_EQ(result.stdout_data, "quick\n");
}

TEST(ExecutorTimeoutTest, SlowCommandTimesOut) {
  ExecOptions options;
  options.timeout = std::chrono::milliseconds(200);
  options.kill_grace = std::chrono::milliseconds(200);
  Executor executor(options);

  auto start = std::chrono::steady_clock::now();
  auto result = executor.run("sleep", {"10"});
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.exit_code, kTimeoutExitCode);
  EXPECT_FALSE(result.ok());
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ExecutorTimeoutTest, PartialOutputIsKept) {
  ExecOptions options;
  options.timeout = std::chrono::milliseconds(300);
  options.kill_grace = std::chrono::milliseconds(200);
  Executor executor(options);

  auto result = executor.run("sh", {"-c", "echo started; sleep 10"});

  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.stdout_data, "started\n");
}

TEST(ExecutorTimeoutTest, IgnoredSigtermEscalatesToSigkill) {
  ExecOptions options;
  options.timeout = std::chrono::milliseconds(200);
  options.kill_grace = std::chrono::milliseconds(200);
  Executor executor(options);

  auto start = std::chrono::steady_clock::now();
  auto result = executor.run("sh", {"-c", "trap '' TERM; sleep 10"});
  auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.exit_code, kTimeoutExitCode);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ExecutorTimeoutTest, ChildClosingOutputStillTimesOut) {
  ExecOptions options;
  options.timeout = std::chrono::milliseconds(200);
  options.kill_grace = std::chrono::milliseconds(200);
  Executor executor(options);

  auto result = executor.run("sh", {"-c", "exec >/dev/null 2>&1; sleep 10"});

  EXPECT_TRUE(result.timed_out);
  EXPECT_EQ(result.exit_code, kTimeoutExitCode);
}
