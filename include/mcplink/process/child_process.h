#ifndef MCPLINK_PROCESS_CHILD_PROCESS_H
#define MCPLINK_PROCESS_CHILD_PROCESS_H

#include <sys/types.h>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mcplink/core/compat.h"
#include "mcplink/core/error.h"

namespace mcplink {
namespace event {
class Dispatcher;
}

namespace process {

struct SpawnOptions {
  std::string command;
  std::vector<std::string> args;
  // Added to (or overriding) the parent's environment
  std::map<std::string, std::string> env;
  optional<std::string> working_directory;
};

struct ExitStatus {
  optional<int> exit_code;
  optional<int> signal;

  // "code: 1, signal: null"
  std::string describe() const;
};

// "SIGTERM" for known signals, "SIG<n>" otherwise
std::string signalName(int signal);

/**
 * Events of one child process, delivered on the dispatcher thread.
 * Implementations must not destroy the ChildProcess from inside these.
 */
class ChildProcessCallbacks {
 public:
  virtual ~ChildProcessCallbacks() = default;

  virtual void onStdout(const char* data, size_t length) = 0;
  virtual void onStderr(const char* data, size_t length) = 0;

  // I/O failure on one of the pipes
  virtual void onProcessError(const std::string& reason) = 0;

  // Fires once, after the process was reaped and its output drained
  virtual void onProcessExit(const ExitStatus& status) = 0;
};

class ChildProcess {
 public:
  virtual ~ChildProcess() = default;

  virtual pid_t pid() const = 0;

  // Queues data for stdin without blocking
  virtual VoidResult write(const std::string& data) = 0;

  virtual void closeStdin() = 0;

  // False if the process has already been reaped or the signal failed
  virtual bool kill(int signal) = 0;

  virtual bool running() const = 0;
};

using ChildProcessPtr = std::unique_ptr<ChildProcess>;

class ProcessLauncher {
 public:
  virtual ~ProcessLauncher() = default;

  // Fails with ConnectFailure if the program cannot be started
  virtual Result<ChildProcessPtr> spawn(const SpawnOptions& options,
                                        ChildProcessCallbacks& callbacks) = 0;
};

/**
 * fork/execvpe launcher whose pipes are watched by a dispatcher.
 *
 * exec failures are reported synchronously through a close-on-exec status
 * pipe. SIGPIPE is ignored process-wide once a launcher exists, so writes
 * to a dead child fail with EPIPE instead of killing the host.
 */
class PosixProcessLauncher : public ProcessLauncher {
 public:
  explicit PosixProcessLauncher(event::Dispatcher& dispatcher);

  Result<ChildProcessPtr> spawn(const SpawnOptions& options,
                                ChildProcessCallbacks& callbacks) override;

 private:
  event::Dispatcher& dispatcher_;
};

}  // namespace process
}  // namespace mcplink

#endif  // MCPLINK_PROCESS_CHILD_PROCESS_H
