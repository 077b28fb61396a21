#include <signal.h>

#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "mcplink/event/event_loop.h"
#include "mcplink/process/child_process.h"

namespace mcplink {
namespace process {
namespace {

using namespace std::chrono_literals;

class RecordingCallbacks : public ChildProcessCallbacks {
 public:
  void onStdout(const char* data, size_t length) override {
    out.append(data, length);
  }
  void onStderr(const char* data, size_t length) override {
    err.append(data, length);
  }
  void onProcessError(const std::string& reason) override {
    errors.push_back(reason);
  }
  void onProcessExit(const ExitStatus& status) override {
    exits++;
    last_status = status;
  }

  std::string out;
  std::string err;
  std::vector<std::string> errors;
  int exits{0};
  ExitStatus last_status;
};

class PosixChildProcessTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dispatcher_ =
        event::createLibeventDispatcherFactory()->createDispatcher("process");
    dispatcher_->run(event::RunType::NonBlock);
    launcher_ = std::make_unique<PosixProcessLauncher>(*dispatcher_);
  }

  ChildProcessPtr spawnShell(const std::string& script) {
    SpawnOptions options;
    options.command = "/bin/sh";
    options.args = {"-c", script};
    auto result = launcher_->spawn(options, callbacks_);
    if (const Error* err = get_error(result)) {
      ADD_FAILURE() << err->message;
      return nullptr;
    }
    return std::move(get<ChildProcessPtr>(result));
  }

  bool waitForExit(std::chrono::milliseconds limit = 5000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (callbacks_.exits == 0) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      dispatcher_->run(event::RunType::NonBlock);
      std::this_thread::sleep_for(2ms);
    }
    return true;
  }

  event::DispatcherPtr dispatcher_;
  std::unique_ptr<PosixProcessLauncher> launcher_;
  RecordingCallbacks callbacks_;
};

TEST_F(PosixChildProcessTest, EchoesStdinThroughCat) {
  SpawnOptions options;
  options.command = "cat";
  auto result = launcher_->spawn(options, callbacks_);
  ASSERT_FALSE(is_error(result));
  ChildProcessPtr child = std::move(get<ChildProcessPtr>(result));
  EXPECT_GT(child->pid(), 0);
  EXPECT_TRUE(child->running());

  ASSERT_FALSE(is_error(child->write("{\"id\":\"r1\"}\n")));
  child->closeStdin();

  ASSERT_TRUE(waitForExit());
  EXPECT_EQ("{\"id\":\"r1\"}\n", callbacks_.out);
  ASSERT_TRUE(callbacks_.last_status.exit_code.has_value());
  EXPECT_EQ(0, *callbacks_.last_status.exit_code);
  EXPECT_FALSE(child->running());
}

TEST_F(PosixChildProcessTest, ReportsExitCodeAndStderr) {
  auto child = spawnShell("echo oops >&2; exit 3");
  ASSERT_NE(nullptr, child);
  ASSERT_TRUE(waitForExit());
  EXPECT_EQ("oops\n", callbacks_.err);
  EXPECT_EQ(3, callbacks_.last_status.exit_code.value_or(-1));
  EXPECT_FALSE(callbacks_.last_status.signal.has_value());
  EXPECT_EQ(1, callbacks_.exits);
}

TEST_F(PosixChildProcessTest, PassesEnvironmentOverrides) {
  SpawnOptions options;
  options.command = "/bin/sh";
  options.args = {"-c", "printf %s \"$MCPLINK_TEST_VALUE\""};
  options.env["MCPLINK_TEST_VALUE"] = "hello";
  auto result = launcher_->spawn(options, callbacks_);
  ASSERT_FALSE(is_error(result));
  ASSERT_TRUE(waitForExit());
  EXPECT_EQ("hello", callbacks_.out);
}

TEST_F(PosixChildProcessTest, MissingProgramFailsToSpawn) {
  SpawnOptions options;
  options.command = "/nonexistent/mcp-server";
  auto result = launcher_->spawn(options, callbacks_);
  ASSERT_TRUE(is_error(result));
  EXPECT_EQ(ErrorKind::ConnectFailure, get_error(result)->kind);
  EXPECT_NE(std::string::npos,
            get_error(result)->message.find("/nonexistent/mcp-server"));
  EXPECT_EQ(0, callbacks_.exits);
}

TEST_F(PosixChildProcessTest, EmptyCommandIsRejected) {
  SpawnOptions options;
  auto result = launcher_->spawn(options, callbacks_);
  ASSERT_TRUE(is_error(result));
}

TEST_F(PosixChildProcessTest, KillReportsSignal) {
  auto child = spawnShell("exec sleep 30");
  ASSERT_NE(nullptr, child);
  EXPECT_TRUE(child->kill(SIGTERM));
  ASSERT_TRUE(waitForExit());
  EXPECT_FALSE(callbacks_.last_status.exit_code.has_value());
  EXPECT_EQ(SIGTERM, callbacks_.last_status.signal.value_or(0));
  EXPECT_FALSE(child->kill(SIGKILL));
}

TEST_F(PosixChildProcessTest, WriteAfterExitFails) {
  auto child = spawnShell("exit 0");
  ASSERT_NE(nullptr, child);
  ASSERT_TRUE(waitForExit());
  EXPECT_TRUE(is_error(child->write("late\n")));
}

TEST(ExitStatusTest, Describe) {
  ExitStatus exited;
  exited.exit_code = 1;
  EXPECT_EQ("code: 1, signal: null", exited.describe());

  ExitStatus killed;
  killed.signal = SIGKILL;
  EXPECT_EQ("code: null, signal: SIGKILL", killed.describe());
  EXPECT_EQ("SIG77", signalName(77));
}

}  // namespace
}  // namespace process
}  // namespace mcplink
