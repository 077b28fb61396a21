#include "mcplink/client/connection_manager.h"

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Client
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace client {

namespace {

constexpr const char* kClosedByClient = "Connection closed by client";

Error unknownConnection(const std::string& connection_id) {
  return Error(ErrorKind::UnknownConnection,
               "No connection found with ID " + connection_id);
}

template <typename T>
void fail(const std::shared_ptr<std::promise<T>>& promise, const Error& error) {
  promise->set_exception(std::make_exception_ptr(ConnectionError(error)));
}

}  // namespace

ConnectParams ConnectParams::forStdio(const std::string& command,
                                      const std::vector<std::string>& args) {
  ConnectParams params;
  params.kind = transport::TransportKind::Stdio;
  params.stdio_params.command = command;
  params.stdio_params.args = args;
  return params;
}

ConnectParams ConnectParams::forSse(const std::string& url) {
  ConnectParams params;
  params.kind = transport::TransportKind::Sse;
  params.sse_params.url = url;
  return params;
}

ConnectionManager::ConnectionManager(event::Dispatcher& dispatcher,
                                     const config::ClientConfig& config,
                                     process::ProcessLauncher& launcher,
                                     http::HttpClient& http_client,
                                     http::EventStreamFactory& streams)
    : dispatcher_(dispatcher),
      config_(config),
      alive_(std::make_shared<bool>(true)) {
  stdio_ = std::make_unique<transport::StdioTransport>(
      dispatcher_, launcher, correlator_, *this, config_);
  sse_ = std::make_unique<transport::SseTransport>(
      dispatcher_, http_client, streams, correlator_, *this, config_);
}

ConnectionManager::~ConnectionManager() {
  alive_.reset();
  closeAll();
}

void ConnectionManager::runOnDispatcher(std::function<void()> work) {
  if (dispatcher_.isThreadSafe()) {
    work();
    return;
  }
  std::weak_ptr<bool> alive = alive_;
  dispatcher_.post([alive, work]() {
    if (!alive.expired()) {
      work();
    }
  });
}

std::future<std::string> ConnectionManager::connect(
    const ConnectParams& params) {
  auto promise = std::make_shared<std::promise<std::string>>();
  std::future<std::string> future = promise->get_future();

  runOnDispatcher([this, params, promise]() {
    if (params.kind == transport::TransportKind::Stdio) {
      Result<std::string> connected =
          stdio_->connect(params.stdio_params, params.on_message);
      if (const Error* err = get_error(connected)) {
        fail(promise, *err);
      } else {
        promise->set_value(get<std::string>(connected));
      }
      return;
    }

    sse_->connect(params.sse_params, params.on_message,
                  [promise](Result<std::string> connected) {
                    if (const Error* err = get_error(connected)) {
                      fail(promise, *err);
                    } else {
                      promise->set_value(get<std::string>(connected));
                    }
                  });
  });
  return future;
}

std::future<bool> ConnectionManager::disconnect(
    const std::string& connection_id) {
  auto promise = std::make_shared<std::promise<bool>>();
  std::future<bool> future = promise->get_future();

  runOnDispatcher([this, connection_id, promise]() {
    promise->set_value(closeConnection(connection_id));
  });
  return future;
}

bool ConnectionManager::closeConnection(const std::string& connection_id) {
  transport::Transport* transport = registry_.find(connection_id);
  if (!transport) {
    MCPLINK_LOG_DEBUG("disconnect: {} is not connected", connection_id);
    return false;
  }
  if (!transport->disconnect(connection_id)) {
    MCPLINK_LOG_WARNING("{} transport had no handle for connection {}",
                        transport::transportKindName(transport->kind()),
                        connection_id);
  }
  registry_.remove(connection_id);
  const size_t rejected = correlator_.rejectAll(
      connection_id, Error(ErrorKind::TransportTerminated, kClosedByClient));
  MCPLINK_LOG_INFO("disconnected {} ({} pending requests rejected)",
                   connection_id, rejected);
  return true;
}

void ConnectionManager::sendRequest(const std::string& connection_id,
                                    const RequestFactory& make_request,
                                    const CallOptions& options,
                                    transport::ResultCallback on_result,
                                    transport::ErrorCallback on_error) {
  transport::Transport* transport = registry_.find(connection_id);
  if (!transport) {
    MCPLINK_LOG_ERROR("no connection found with ID {}", connection_id);
    on_error(unknownConnection(connection_id));
    return;
  }

  const protocol::McpRequest request =
      make_request(correlator_.nextRequestId(connection_id));
  if (correlator_.isPending(connection_id, request.id)) {
    on_error(Error(ErrorKind::InvalidArgument,
                   "Request id " + request.id + " is already pending"));
    return;
  }

  transport::PendingRequest pending;
  pending.method = request.method;
  pending.on_result = std::move(on_result);
  pending.on_error = std::move(on_error);

  const std::chrono::milliseconds timeout =
      options.timeout ? *options.timeout : config_.request_timeout;
  if (timeout.count() > 0) {
    std::weak_ptr<bool> alive = alive_;
    const std::string request_id = request.id;
    const std::string method = request.method;
    pending.deadline = dispatcher_.createTimer(
        [this, alive, connection_id, request_id, method, timeout]() {
          // The timer belongs to the pending entry; reject outside its
          // own callback
          dispatcher_.post([this, alive, connection_id, request_id, method,
                            timeout]() {
            if (alive.expired()) {
              return;
            }
            MCPLINK_LOG_WARNING("{} request {} on {} timed out", method,
                                request_id, connection_id);
            correlator_.reject(
                connection_id, request_id,
                Error(ErrorKind::RequestTimeout,
                      "Request " + method + " timed out after " +
                          std::to_string(timeout.count()) + "ms"));
          });
        });
    pending.deadline->enableTimer(timeout);
  }

  if (!correlator_.registerRequest(connection_id, request.id,
                                   std::move(pending))) {
    MCPLINK_LOG_ERROR("request id {} already pending on {}", request.id,
                      connection_id);
    return;
  }

  MCPLINK_LOG_DEBUG("sending {} {} on {}", request.method, request.id,
                    connection_id);
  VoidResult sent = transport->send(connection_id, request);
  if (const Error* err = get_error(sent)) {
    correlator_.reject(connection_id, request.id, *err);
  }
}

std::future<std::vector<protocol::ToolDefinition>> ConnectionManager::listTools(
    const std::string& connection_id, const CallOptions& options) {
  using Tools = std::vector<protocol::ToolDefinition>;
  auto promise = std::make_shared<std::promise<Tools>>();
  std::future<Tools> future = promise->get_future();

  runOnDispatcher([this, connection_id, options, promise]() {
    MCPLINK_LOG_INFO("listing tools for connection {}", connection_id);
    sendRequest(
        connection_id,
        [](const std::string& request_id) {
          return protocol::makeListToolsRequest(request_id);
        },
        options,
        [promise](const json::JsonValue& result) {
          Result<Tools> tools = protocol::parseToolList(result);
          if (const Error* err = get_error(tools)) {
            fail(promise, *err);
          } else {
            promise->set_value(std::move(get<Tools>(tools)));
          }
        },
        [promise](const Error& error) { fail(promise, error); });
  });
  return future;
}

std::future<json::JsonValue> ConnectionManager::callTool(
    const std::string& connection_id,
    const std::string& tool_name,
    const json::JsonValue& arguments,
    const CallOptions& options) {
  auto promise = std::make_shared<std::promise<json::JsonValue>>();
  std::future<json::JsonValue> future = promise->get_future();

  runOnDispatcher([this, connection_id, tool_name, arguments, options,
                   promise]() {
    MCPLINK_LOG_INFO("calling tool {} on connection {}", tool_name,
                     connection_id);
    sendRequest(
        connection_id,
        [tool_name, arguments](const std::string& request_id) {
          return protocol::makeCallToolRequest(request_id, tool_name,
                                               arguments);
        },
        options,
        [promise](const json::JsonValue& result) {
          promise->set_value(result);
        },
        [promise](const Error& error) { fail(promise, error); });
  });
  return future;
}

void ConnectionManager::closeAll() {
  const size_t cancelled = sse_->cancelPendingConnects();
  if (cancelled > 0) {
    MCPLINK_LOG_INFO("cancelled {} SSE connects in progress", cancelled);
  }
  for (const std::string& id : registry_.allIds()) {
    try {
      closeConnection(id);
    } catch (const std::exception& e) {
      MCPLINK_LOG_ERROR("error closing connection {}: {}", id, e.what());
    }
  }
}

void ConnectionManager::closeAllConnections() {
  MCPLINK_LOG_INFO("closing all connections ({} open)", registry_.size());
  if (dispatcher_.isThreadSafe()) {
    closeAll();
    return;
  }

  auto done = std::make_shared<std::promise<void>>();
  std::future<void> finished = done->get_future();
  runOnDispatcher([this, done]() {
    closeAll();
    done->set_value();
  });
  try {
    finished.get();
  } catch (const std::future_error& e) {
    MCPLINK_LOG_ERROR("closing connections did not complete: {}", e.what());
  }
}

std::vector<std::string> ConnectionManager::getActiveStdioConnectionIds()
    const {
  return registry_.idsOf(transport::TransportKind::Stdio);
}

std::vector<std::string> ConnectionManager::getActiveSseConnectionIds() const {
  return registry_.idsOf(transport::TransportKind::Sse);
}

void ConnectionManager::setConnectionClosedObserver(
    ConnectionClosedObserver observer) {
  runOnDispatcher([this, observer]() { closed_observer_ = observer; });
}

void ConnectionManager::onConnectionOpened(const std::string& connection_id,
                                           transport::TransportKind kind,
                                           const std::string& endpoint,
                                           transport::Transport& transport) {
  ConnectionInfo info;
  info.id = connection_id;
  info.kind = kind;
  info.endpoint = endpoint;
  info.opened_at = std::chrono::system_clock::now();
  if (registry_.add(info, transport)) {
    MCPLINK_LOG_INFO("{} connection {} established to {} for client {}",
                     transport::transportKindName(kind), connection_id,
                     endpoint, config_.client_id);
  }
}

void ConnectionManager::onConnectionTerminated(
    const std::string& connection_id, const Error& reason) {
  registry_.remove(connection_id);
  const size_t rejected = correlator_.rejectAll(connection_id, reason);
  MCPLINK_LOG_WARNING("connection {} terminated: {} ({} pending requests "
                      "rejected)",
                      connection_id, reason.message, rejected);
  if (closed_observer_) {
    closed_observer_(connection_id, reason);
  }
}

}  // namespace client
}  // namespace mcplink
