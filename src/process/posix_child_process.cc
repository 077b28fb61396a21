#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <mutex>

#include "mcplink/event/event_loop.h"
#include "mcplink/process/child_process.h"

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Process
#include "mcplink/logging/log_macros.h"

extern char** environ;

namespace mcplink {
namespace process {

namespace {

constexpr size_t kReadChunk = 64 * 1024;
constexpr std::chrono::milliseconds kRunningPollInterval{50};
constexpr std::chrono::milliseconds kDrainPollInterval{5};
// Output pipes may be held open by grandchildren after the child exits
constexpr int kMaxDrainPolls = 100;

void closeFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

ExitStatus toExitStatus(int wait_status) {
  ExitStatus status;
  if (WIFEXITED(wait_status)) {
    status.exit_code = WEXITSTATUS(wait_status);
  } else if (WIFSIGNALED(wait_status)) {
    status.signal = WTERMSIG(wait_status);
  }
  return status;
}

struct Pipe {
  int read_end{-1};
  int write_end{-1};

  bool open() {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
      return false;
    }
    read_end = fds[0];
    write_end = fds[1];
    return true;
  }

  void close() {
    closeFd(read_end);
    closeFd(write_end);
  }
};

class PosixChildProcess : public ChildProcess {
 public:
  PosixChildProcess(event::Dispatcher& dispatcher,
                    pid_t pid,
                    int stdin_fd,
                    int stdout_fd,
                    int stderr_fd,
                    ChildProcessCallbacks& callbacks)
      : pid_(pid),
        stdin_fd_(stdin_fd),
        stdout_fd_(stdout_fd),
        stderr_fd_(stderr_fd),
        callbacks_(callbacks) {
    setNonBlocking(stdin_fd_);
    setNonBlocking(stdout_fd_);
    setNonBlocking(stderr_fd_);

    stdout_event_ = dispatcher.createFileEvent(
        stdout_fd_, [this](uint32_t) { onReadable(stdout_fd_, true); },
        event::FileTriggerType::Level,
        static_cast<uint32_t>(event::FileReadyType::Read));
    stderr_event_ = dispatcher.createFileEvent(
        stderr_fd_, [this](uint32_t) { onReadable(stderr_fd_, false); },
        event::FileTriggerType::Level,
        static_cast<uint32_t>(event::FileReadyType::Read));
    stdin_event_ = dispatcher.createFileEvent(
        stdin_fd_, [this](uint32_t) { flushStdin(); },
        event::FileTriggerType::Level, 0);
    reap_timer_ = dispatcher.createTimer([this]() { pollExit(); });
    reap_timer_->enableTimer(kRunningPollInterval);
  }

  ~PosixChildProcess() override {
    reap_timer_.reset();
    stdin_event_.reset();
    stdout_event_.reset();
    stderr_event_.reset();
    closeFd(stdin_fd_);
    closeFd(stdout_fd_);
    closeFd(stderr_fd_);

    if (!reaped_) {
      int wait_status = 0;
      if (waitpid(pid_, &wait_status, WNOHANG) == 0) {
        ::kill(pid_, SIGKILL);
        while (waitpid(pid_, &wait_status, 0) < 0 && errno == EINTR) {
        }
      }
    }
  }

  pid_t pid() const override { return pid_; }

  VoidResult write(const std::string& data) override {
    if (stdin_fd_ < 0) {
      return makeVoidError(
          Error(ErrorKind::SendFailure, "stdin of process is not writable"));
    }
    bool was_idle = pending_input_.empty();
    pending_input_.append(data);
    if (!was_idle) {
      return makeVoidSuccess();
    }

    ssize_t written;
    do {
      written = ::write(stdin_fd_, pending_input_.data(), pending_input_.size());
    } while (written < 0 && errno == EINTR);

    if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      std::string reason = std::strerror(errno);
      pending_input_.clear();
      dropStdin();
      return makeVoidError(Error(ErrorKind::SendFailure,
                                 "write to process stdin failed: " + reason));
    }
    if (written > 0) {
      pending_input_.erase(0, static_cast<size_t>(written));
    }
    if (!pending_input_.empty()) {
      stdin_event_->setEnabled(
          static_cast<uint32_t>(event::FileReadyType::Write));
    }
    return makeVoidSuccess();
  }

  void closeStdin() override {
    pending_input_.clear();
    dropStdin();
  }

  bool kill(int signal) override {
    if (reaped_) {
      return false;
    }
    return ::kill(pid_, signal) == 0;
  }

  bool running() const override { return !reaped_; }

 private:
  void dropStdin() {
    stdin_event_->setEnabled(0);
    closeFd(stdin_fd_);
  }

  void flushStdin() {
    while (!pending_input_.empty() && stdin_fd_ >= 0) {
      ssize_t written =
          ::write(stdin_fd_, pending_input_.data(), pending_input_.size());
      if (written > 0) {
        pending_input_.erase(0, static_cast<size_t>(written));
        continue;
      }
      if (written < 0 && errno == EINTR) {
        continue;
      }
      if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
      }
      std::string reason = std::strerror(errno);
      pending_input_.clear();
      dropStdin();
      callbacks_.onProcessError("write to process stdin failed: " + reason);
      return;
    }
    stdin_event_->setEnabled(0);
  }

  void onReadable(int& fd, bool is_stdout) {
    char buffer[kReadChunk];
    while (fd >= 0) {
      ssize_t n = ::read(fd, buffer, sizeof(buffer));
      if (n > 0) {
        if (is_stdout) {
          callbacks_.onStdout(buffer, static_cast<size_t>(n));
        } else {
          callbacks_.onStderr(buffer, static_cast<size_t>(n));
        }
        continue;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
      }
      if (n < 0) {
        std::string reason = std::strerror(errno);
        closeOutput(fd, is_stdout);
        callbacks_.onProcessError(
            std::string("read from process ") +
            (is_stdout ? "stdout" : "stderr") + " failed: " + reason);
        return;
      }
      closeOutput(fd, is_stdout);
      if (outputsClosed()) {
        reap_timer_->enableTimer(std::chrono::milliseconds(0));
      }
      return;
    }
  }

  void closeOutput(int& fd, bool is_stdout) {
    if (is_stdout) {
      stdout_event_->setEnabled(0);
    } else {
      stderr_event_->setEnabled(0);
    }
    closeFd(fd);
  }

  bool outputsClosed() const { return stdout_fd_ < 0 && stderr_fd_ < 0; }

  void pollExit() {
    if (exit_reported_) {
      return;
    }
    if (!reaped_) {
      int wait_status = 0;
      pid_t rc = waitpid(pid_, &wait_status, WNOHANG);
      if (rc == pid_) {
        reaped_ = true;
        status_ = toExitStatus(wait_status);
        MCPLINK_LOG_DEBUG("process {} exited ({})", pid_, status_.describe());
      } else if (rc < 0 && errno != EINTR) {
        // Reaped elsewhere; the exit status is lost
        reaped_ = true;
        MCPLINK_LOG_WARNING("waitpid({}) failed: {}", pid_,
                            std::strerror(errno));
      }
    }

    if (reaped_ && !outputsClosed() && ++drain_polls_ > kMaxDrainPolls) {
      closeOutput(stdout_fd_, true);
      closeOutput(stderr_fd_, false);
    }

    if (reaped_ && outputsClosed()) {
      exit_reported_ = true;
      dropStdin();
      callbacks_.onProcessExit(status_);
      return;
    }

    reap_timer_->enableTimer(reaped_ || outputsClosed() ? kDrainPollInterval
                                                        : kRunningPollInterval);
  }

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;
  ChildProcessCallbacks& callbacks_;

  event::FileEventPtr stdin_event_;
  event::FileEventPtr stdout_event_;
  event::FileEventPtr stderr_event_;
  event::TimerPtr reap_timer_;

  std::string pending_input_;
  bool reaped_{false};
  bool exit_reported_{false};
  int drain_polls_{0};
  ExitStatus status_;
};

void ignoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> buildEnvironment(
    const std::map<std::string, std::string>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string item(*entry);
    std::string key = item.substr(0, item.find('='));
    if (overrides.count(key) == 0) {
      env.push_back(std::move(item));
    }
  }
  for (const auto& kv : overrides) {
    env.push_back(kv.first + "=" + kv.second);
  }
  return env;
}

}  // namespace

std::string signalName(int signal) {
  switch (signal) {
    case SIGHUP: return "SIGHUP";
    case SIGINT: return "SIGINT";
    case SIGQUIT: return "SIGQUIT";
    case SIGILL: return "SIGILL";
    case SIGABRT: return "SIGABRT";
    case SIGFPE: return "SIGFPE";
    case SIGKILL: return "SIGKILL";
    case SIGSEGV: return "SIGSEGV";
    case SIGPIPE: return "SIGPIPE";
    case SIGALRM: return "SIGALRM";
    case SIGTERM: return "SIGTERM";
    case SIGUSR1: return "SIGUSR1";
    case SIGUSR2: return "SIGUSR2";
    case SIGBUS: return "SIGBUS";
  }
  return "SIG" + std::to_string(signal);
}

std::string ExitStatus::describe() const {
  return "code: " + (exit_code ? std::to_string(*exit_code) : "null") +
         ", signal: " + (signal ? signalName(*signal) : "null");
}

PosixProcessLauncher::PosixProcessLauncher(event::Dispatcher& dispatcher)
    : dispatcher_(dispatcher) {
  ignoreSigpipe();
}

Result<ChildProcessPtr> PosixProcessLauncher::spawn(
    const SpawnOptions& options,
    ChildProcessCallbacks& callbacks) {
  if (options.command.empty()) {
    return makeError<ChildProcessPtr>(ErrorKind::ConnectFailure,
                                      "command must not be empty");
  }

  // Everything the child needs is prepared before fork
  std::vector<std::string> env_storage = buildEnvironment(options.env);
  std::vector<char*> envp;
  for (auto& item : env_storage) {
    envp.push_back(&item[0]);
  }
  envp.push_back(nullptr);

  std::vector<std::string> arg_storage;
  arg_storage.push_back(options.command);
  arg_storage.insert(arg_storage.end(), options.args.begin(),
                     options.args.end());
  std::vector<char*> argv;
  for (auto& arg : arg_storage) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(nullptr);

  const char* workdir =
      options.working_directory ? options.working_directory->c_str() : nullptr;

  Pipe in, out, err, status;
  if (!in.open() || !out.open() || !err.open() || !status.open()) {
    std::string reason = std::strerror(errno);
    in.close();
    out.close();
    err.close();
    status.close();
    return makeError<ChildProcessPtr>(ErrorKind::ConnectFailure,
                                      "failed to create pipes: " + reason);
  }

  pid_t pid = fork();
  if (pid < 0) {
    std::string reason = std::strerror(errno);
    in.close();
    out.close();
    err.close();
    status.close();
    return makeError<ChildProcessPtr>(ErrorKind::ConnectFailure,
                                      "fork failed: " + reason);
  }

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on
    ::signal(SIGPIPE, SIG_DFL);
    dup2(in.read_end, STDIN_FILENO);
    dup2(out.write_end, STDOUT_FILENO);
    dup2(err.write_end, STDERR_FILENO);
    if (workdir && chdir(workdir) != 0) {
      int code = errno;
      ssize_t rc = ::write(status.write_end, &code, sizeof(code));
      (void)rc;
      _exit(127);
    }
    execvpe(argv[0], argv.data(), envp.data());
    int code = errno;
    ssize_t rc = ::write(status.write_end, &code, sizeof(code));
    (void)rc;
    _exit(127);
  }

  closeFd(in.read_end);
  closeFd(out.write_end);
  closeFd(err.write_end);
  closeFd(status.write_end);

  // EOF without data means exec succeeded
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(status.read_end, &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  closeFd(status.read_end);

  if (n > 0) {
    int wait_status = 0;
    while (waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
    }
    in.close();
    out.close();
    err.close();
    return makeError<ChildProcessPtr>(
        ErrorKind::ConnectFailure,
        "failed to spawn '" + options.command + "': " +
            std::strerror(child_errno));
  }

  MCPLINK_LOG_DEBUG("spawned '{}' as pid {}", options.command, pid);
  ChildProcessPtr child = std::make_unique<PosixChildProcess>(
      dispatcher_, pid, in.write_end, out.read_end, err.read_end, callbacks);
  return Result<ChildProcessPtr>(std::move(child));
}

}  // namespace process
}  // namespace mcplink
