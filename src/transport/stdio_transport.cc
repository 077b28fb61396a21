#include "mcplink/transport/stdio_transport.h"

#include <signal.h>

#include "mcplink/transport/frame_codec.h"

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Stdio
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace transport {

namespace {

std::string commandLine(const StdioConnectParams& params) {
  std::string line = params.command;
  for (const auto& arg : params.args) {
    line += ' ';
    line += arg;
  }
  return line;
}

std::string trimTrailingNewlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

}  // namespace

class StdioTransport::StdioConnection : public process::ChildProcessCallbacks,
                                        public FrameCodecCallbacks,
                                        public event::DeferredDeletable {
 public:
  StdioConnection(StdioTransport& parent,
                  const std::string& id,
                  const std::string& command_line,
                  MessageHandler handler)
      : parent_(parent),
        id_(id),
        command_line_(command_line),
        handler_(std::move(handler)),
        codec_(*this) {}

  const std::string& id() const { return id_; }
  const std::string& commandLine() const { return command_line_; }
  process::ChildProcess& process() { return *process_; }
  void attach(process::ChildProcessPtr process) {
    process_ = std::move(process);
  }

  bool open() const { return open_; }
  void markClosed() { open_ = false; }

  void armKillTimer(event::Dispatcher& dispatcher,
                    std::chrono::milliseconds grace) {
    kill_timer_ = dispatcher.createTimer([this]() {
      MCPLINK_LOG_WARNING("'{}' ignored SIGTERM, sending SIGKILL",
                          command_line_);
      process_->kill(SIGKILL);
    });
    kill_timer_->enableTimer(grace);
  }

  // process::ChildProcessCallbacks
  void onStdout(const char* data, size_t length) override {
    codec_.feed(data, length);
  }

  void onStderr(const char* data, size_t length) override {
    stderr_tail_.append(data, length);
    const size_t limit = parent_.config_.stderr_tail_bytes;
    if (stderr_tail_.size() > limit) {
      stderr_tail_.erase(0, stderr_tail_.size() - limit);
    }
    MCPLINK_LOG_WARNING("stderr from '{}': {}", command_line_,
                        trimTrailingNewlines(std::string(data, length)));
  }

  void onProcessError(const std::string& reason) override {
    MCPLINK_LOG_ERROR("process error on connection {}: {}", id_, reason);
    if (open_) {
      parent_.terminate(
          *this, Error(ErrorKind::TransportTerminated,
                       "Connection error occurred before response: " + reason));
    }
  }

  void onProcessExit(const process::ExitStatus& status) override {
    MCPLINK_LOG_INFO("'{}' on connection {} exited ({})", command_line_, id_,
                     status.describe());
    kill_timer_.reset();
    if (!open_) {
      parent_.retire(*this);
      return;
    }

    json::JsonValue data = json::JsonValue::object();
    data.set("exitCode", status.exit_code ? json::JsonValue(*status.exit_code)
                                          : json::JsonValue::null());
    data.set("signal", status.signal
                           ? json::JsonValue(process::signalName(*status.signal))
                           : json::JsonValue::null());
    if (!stderr_tail_.empty()) {
      data.set("stderr", stderr_tail_);
    }
    parent_.terminate(
        *this, Error(ErrorKind::TransportTerminated,
                     "Connection closed before response (" +
                         status.describe() + ")",
                     status.exit_code ? *status.exit_code : 0, data));
  }

  // FrameCodecCallbacks
  void onFrame(const json::JsonValue& message) override {
    if (!open_) {
      return;
    }
    optional<std::string> request_id = protocol::messageId(message);
    if (request_id && parent_.correlator_.isPending(id_, *request_id)) {
      parent_.correlator_.resolve(id_, *request_id,
                                  protocol::responseOutcome(message));
      return;
    }
    if (handler_) {
      handler_(InboundMessage{id_, message, message.toString()});
    }
  }

  void onMalformedFrame(const std::string& line) override {
    if (!open_) {
      return;
    }
    MCPLINK_LOG_DEBUG("non-JSON line on connection {}: {}", id_, line);
    if (handler_) {
      handler_(InboundMessage{id_, nullopt, line});
    }
  }

 private:
  StdioTransport& parent_;
  const std::string id_;
  const std::string command_line_;
  MessageHandler handler_;
  FrameCodec codec_;
  process::ChildProcessPtr process_;
  std::string stderr_tail_;
  event::TimerPtr kill_timer_;
  bool open_{true};
};

StdioTransport::StdioTransport(event::Dispatcher& dispatcher,
                               process::ProcessLauncher& launcher,
                               RequestCorrelator& correlator,
                               ConnectionLifecycle& lifecycle,
                               const config::ClientConfig& config)
    : dispatcher_(dispatcher),
      launcher_(launcher),
      correlator_(correlator),
      lifecycle_(lifecycle),
      config_(config) {}

StdioTransport::~StdioTransport() {
  // Remaining children are killed and reaped by their handles
  connections_.clear();
  draining_.clear();
}

Result<std::string> StdioTransport::connect(const StdioConnectParams& params,
                                            MessageHandler handler) {
  const std::string id = generateConnectionId();
  auto connection = std::make_unique<StdioConnection>(
      *this, id, commandLine(params), std::move(handler));

  process::SpawnOptions options;
  options.command = params.command;
  options.args = params.args;
  options.env = params.env;

  auto spawned = launcher_.spawn(options, *connection);
  if (const Error* err = get_error(spawned)) {
    MCPLINK_LOG_ERROR("failed to start '{}': {}", connection->commandLine(),
                      err->message);
    return Error(ErrorKind::ConnectFailure, err->message, err->code);
  }
  connection->attach(std::move(get<process::ChildProcessPtr>(spawned)));

  MCPLINK_LOG_INFO("connection {} started '{}' (pid {})", id,
                   connection->commandLine(), connection->process().pid());
  StdioConnection& ref = *connection;
  connections_.emplace(id, std::move(connection));
  lifecycle_.onConnectionOpened(id, TransportKind::Stdio, ref.commandLine(),
                                *this);
  return id;
}

VoidResult StdioTransport::send(const std::string& connection_id,
                                const protocol::McpRequest& request) {
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return makeVoidError(Error(ErrorKind::UnknownConnection,
                               "No connection found with ID " + connection_id));
  }
  auto result = it->second->process().write(
      FrameCodec::encode(request.toJson()));
  if (const Error* err = get_error(result)) {
    MCPLINK_LOG_ERROR("failed to send {} on connection {}: {}", request.method,
                      connection_id, err->message);
  }
  return result;
}

bool StdioTransport::disconnect(const std::string& connection_id) {
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return false;
  }
  std::unique_ptr<StdioConnection> connection = std::move(it->second);
  connections_.erase(it);
  connection->markClosed();
  MCPLINK_LOG_INFO("closing connection {} ('{}')", connection_id,
                   connection->commandLine());
  beginShutdown(std::move(connection));
  return true;
}

void StdioTransport::terminate(StdioConnection& connection,
                               const Error& reason) {
  const std::string id = connection.id();
  connection.markClosed();

  auto it = connections_.find(id);
  if (it != connections_.end()) {
    std::unique_ptr<StdioConnection> owned = std::move(it->second);
    connections_.erase(it);
    if (owned->process().running()) {
      beginShutdown(std::move(owned));
    } else {
      dispatcher_.deferredDelete(std::move(owned));
    }
  }
  lifecycle_.onConnectionTerminated(id, reason);
}

void StdioTransport::retire(StdioConnection& connection) {
  auto it = draining_.find(connection.id());
  if (it != draining_.end()) {
    std::unique_ptr<StdioConnection> owned = std::move(it->second);
    draining_.erase(it);
    dispatcher_.deferredDelete(std::move(owned));
  }
}

void StdioTransport::beginShutdown(
    std::unique_ptr<StdioConnection> connection) {
  process::ChildProcess& child = connection->process();
  child.closeStdin();
  if (!child.running() || !child.kill(SIGTERM)) {
    dispatcher_.deferredDelete(std::move(connection));
    return;
  }
  if (config_.kill_grace.count() > 0) {
    connection->armKillTimer(dispatcher_, config_.kill_grace);
  } else {
    child.kill(SIGKILL);
  }
  const std::string id = connection->id();
  draining_[id] = std::move(connection);
}

}  // namespace transport
}  // namespace mcplink
