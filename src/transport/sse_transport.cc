#include "mcplink/transport/sse_transport.h"

#include "mcplink/protocol/mcp_message.h"

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Sse
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace transport {

Result<json::JsonValue> httpOutcome(const http::HttpResponse& response) {
  if (response.transportFailed()) {
    return Error(ErrorKind::SendFailure,
                 "HTTP request failed: " + response.error);
  }
  if (!response.success()) {
    std::string phrase = response.status_text;
    if (phrase.empty()) {
      phrase = http::reasonPhrase(response.status_code);
    }
    Error error(ErrorKind::HttpStatus,
                "HTTP error from MCP server: " +
                    std::to_string(response.status_code) + " " + phrase,
                response.status_code);
    if (!response.body.empty()) {
      error.data = json::JsonValue(response.body);
    }
    return error;
  }

  json::JsonValue body;
  try {
    body = json::JsonValue::parse(response.body);
  } catch (const json::JsonException& e) {
    return Error(ErrorKind::InvalidResponse,
                 std::string("Invalid JSON in MCP response: ") + e.what());
  }
  if (!body.isObject()) {
    return Error(ErrorKind::InvalidResponse,
                 "MCP response is not an object: " + body.toString());
  }
  return protocol::responseOutcome(body);
}

class SseTransport::SseConnection : public http::EventStreamCallbacks,
                                    public event::DeferredDeletable {
 public:
  SseConnection(SseTransport& parent,
                const std::string& id,
                const SseConnectParams& params,
                MessageHandler handler,
                ConnectCallback done)
      : parent_(parent),
        id_(id),
        params_(params),
        handler_(std::move(handler)),
        done_(std::move(done)) {}

  ~SseConnection() override { closeStream(); }

  const std::string& id() const { return id_; }
  const std::string& url() const { return params_.url; }
  const std::map<std::string, std::string>& headers() const {
    return params_.headers;
  }
  bool opened() const { return opened_; }

  void start(const http::EventStreamOptions& options,
             std::chrono::milliseconds connect_timeout) {
    if (connect_timeout.count() > 0) {
      connect_timer_ = parent_.dispatcher_.createTimer([this, connect_timeout]() {
        parent_.onOpenFailed(*this, "timed out after " +
                                        std::to_string(connect_timeout.count()) +
                                        "ms");
      });
      connect_timer_->enableTimer(connect_timeout);
    }
    // A stream may report synchronously; stream_ is set either way
    http::EventStreamPtr stream = parent_.streams_.open(options, *this);
    if (closed_) {
      stream->close();
    }
    stream_ = std::move(stream);
  }

  void markOpened() {
    opened_ = true;
    if (connect_timer_) {
      connect_timer_->disableTimer();
    }
  }

  void closeStream() {
    closed_ = true;
    if (connect_timer_) {
      connect_timer_->disableTimer();
    }
    if (stream_) {
      stream_->close();
    }
  }

  // Hands the connect outcome to the caller, at most once
  void complete(Result<std::string> outcome) {
    if (done_) {
      ConnectCallback done = std::move(done_);
      done_ = nullptr;
      done(std::move(outcome));
    }
  }

  // http::EventStreamCallbacks
  void onOpen() override {
    if (closed_ || opened_) {
      return;
    }
    parent_.onOpened(*this);
  }

  void onMessage(const http::SseEvent& event) override {
    if (closed_ || !handler_) {
      return;
    }
    if (event.data.empty()) {
      MCPLINK_LOG_DEBUG("empty event '{}' on connection {}",
                        event.event ? *event.event : std::string("message"),
                        id_);
      return;
    }
    try {
      handler_(InboundMessage{id_, json::JsonValue::parse(event.data),
                              event.data});
    } catch (const json::JsonException&) {
      MCPLINK_LOG_DEBUG("non-JSON event on connection {}: {}", id_,
                        event.data);
      handler_(InboundMessage{id_, nullopt, event.data});
    }
  }

  void onError(const std::string& reason) override {
    if (closed_) {
      return;
    }
    if (!opened_) {
      parent_.onOpenFailed(*this, reason);
      return;
    }
    if (stream_ && stream_->readyState() == http::ReadyState::Closed) {
      parent_.onStreamClosed(*this, reason);
      return;
    }
    MCPLINK_LOG_WARNING("event stream of connection {} interrupted: {}", id_,
                        reason);
  }

 private:
  SseTransport& parent_;
  const std::string id_;
  const SseConnectParams params_;
  MessageHandler handler_;
  ConnectCallback done_;
  http::EventStreamPtr stream_;
  event::TimerPtr connect_timer_;
  bool opened_{false};
  bool closed_{false};
};

SseTransport::SseTransport(event::Dispatcher& dispatcher,
                           http::HttpClient& http_client,
                           http::EventStreamFactory& streams,
                           RequestCorrelator& correlator,
                           ConnectionLifecycle& lifecycle,
                           const config::ClientConfig& config)
    : dispatcher_(dispatcher),
      http_client_(http_client),
      streams_(streams),
      correlator_(correlator),
      lifecycle_(lifecycle),
      config_(config),
      alive_(std::make_shared<bool>(true)) {}

SseTransport::~SseTransport() {
  alive_.reset();
  for (auto& entry : connecting_) {
    entry.second->closeStream();
    entry.second->complete(cancelledConnect(*entry.second));
  }
  connecting_.clear();
  connections_.clear();
}

Error SseTransport::cancelledConnect(const SseConnection& connection) const {
  return Error(ErrorKind::ConnectFailure,
               "Failed to establish SSE connection to " + connection.url() +
                   ": connection closed by client");
}

std::map<std::string, std::string> SseTransport::requestHeaders(
    const SseConnection& connection) const {
  std::map<std::string, std::string> headers = connection.headers();
  if (!config_.connection_token.empty()) {
    headers["Authorization"] = "Bearer " + config_.connection_token;
  }
  return headers;
}

void SseTransport::connect(const SseConnectParams& params,
                           MessageHandler handler,
                           ConnectCallback done) {
  const std::string id = generateConnectionId();
  auto connection = std::make_unique<SseConnection>(
      *this, id, params, std::move(handler), std::move(done));
  SseConnection& ref = *connection;
  connecting_.emplace(id, std::move(connection));

  http::EventStreamOptions options;
  options.url = params.url;
  options.headers = requestHeaders(ref);
  options.retry = config_.sse_retry;
  options.max_reconnect_attempts = config_.sse_max_reconnect_attempts;

  MCPLINK_LOG_INFO("connecting to {} as {}", params.url, config_.client_id);
  ref.start(options, config_.connect_timeout);
}

void SseTransport::onOpened(SseConnection& connection) {
  auto it = connecting_.find(connection.id());
  if (it == connecting_.end()) {
    return;
  }
  std::unique_ptr<SseConnection> owned = std::move(it->second);
  connecting_.erase(it);
  owned->markOpened();

  const std::string id = owned->id();
  MCPLINK_LOG_INFO("connection {} open to {}", id, owned->url());
  connections_.emplace(id, std::move(owned));
  lifecycle_.onConnectionOpened(id, TransportKind::Sse, connection.url(),
                                *this);
  connection.complete(id);
}

void SseTransport::onOpenFailed(SseConnection& connection,
                                const std::string& reason) {
  auto it = connecting_.find(connection.id());
  if (it == connecting_.end()) {
    return;
  }
  std::unique_ptr<SseConnection> owned = std::move(it->second);
  connecting_.erase(it);
  owned->closeStream();

  MCPLINK_LOG_ERROR("failed to connect to {}: {}", owned->url(), reason);
  Error error(ErrorKind::ConnectFailure, "Failed to establish SSE connection to " +
                                             owned->url() + ": " + reason);
  owned->complete(error);
  dispatcher_.deferredDelete(std::move(owned));
}

void SseTransport::onStreamClosed(SseConnection& connection,
                                  const std::string& reason) {
  const std::string id = connection.id();
  auto it = connections_.find(id);
  if (it == connections_.end()) {
    return;
  }
  std::unique_ptr<SseConnection> owned = std::move(it->second);
  connections_.erase(it);
  owned->closeStream();

  MCPLINK_LOG_ERROR("event stream of connection {} closed: {}", id, reason);
  dispatcher_.deferredDelete(std::move(owned));
  lifecycle_.onConnectionTerminated(
      id, Error(ErrorKind::TransportTerminated, "SSE connection closed: " + reason));
}

VoidResult SseTransport::send(const std::string& connection_id,
                              const protocol::McpRequest& request) {
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return makeVoidError(Error(ErrorKind::UnknownConnection,
                               "No connection found with ID " + connection_id));
  }

  http::HttpRequest post;
  post.url = it->second->url();
  post.method = http::HttpMethod::Post;
  post.headers = requestHeaders(*it->second);
  post.headers["Content-Type"] = "application/json";
  post.headers["Accept"] = "application/json";
  post.body = request.toJson().toString();

  std::weak_ptr<bool> alive = alive_;
  const std::string request_id = request.id;
  MCPLINK_LOG_DEBUG("POST {} to {} ({})", request.method, post.url,
                    request_id);
  http_client_.requestAsync(
      post, [this, alive, connection_id,
             request_id](const http::HttpResponse& response) {
        if (alive.expired()) {
          return;
        }
        onPostResponse(connection_id, request_id, response);
      });
  return makeVoidSuccess();
}

void SseTransport::onPostResponse(const std::string& connection_id,
                                  const std::string& request_id,
                                  const http::HttpResponse& response) {
  Result<json::JsonValue> outcome = httpOutcome(response);
  if (const Error* err = get_error(outcome)) {
    MCPLINK_LOG_ERROR("request {} on connection {} failed: {}", request_id,
                      connection_id, err->message);
  }
  if (!correlator_.resolve(connection_id, request_id, outcome)) {
    MCPLINK_LOG_DEBUG("dropping late response to {} on connection {}",
                      request_id, connection_id);
  }
}

bool SseTransport::disconnect(const std::string& connection_id) {
  auto it = connections_.find(connection_id);
  if (it != connections_.end()) {
    std::unique_ptr<SseConnection> owned = std::move(it->second);
    connections_.erase(it);
    owned->closeStream();
    MCPLINK_LOG_INFO("closing connection {} to {}", connection_id,
                     owned->url());
    dispatcher_.deferredDelete(std::move(owned));
    return true;
  }
  auto pending = connecting_.find(connection_id);
  if (pending != connecting_.end()) {
    std::unique_ptr<SseConnection> owned = std::move(pending->second);
    connecting_.erase(pending);
    owned->closeStream();
    owned->complete(cancelledConnect(*owned));
    dispatcher_.deferredDelete(std::move(owned));
    return true;
  }
  return false;
}

size_t SseTransport::cancelPendingConnects() {
  std::unordered_map<std::string, std::unique_ptr<SseConnection>> cancelled;
  cancelled.swap(connecting_);
  for (auto& entry : cancelled) {
    std::unique_ptr<SseConnection> owned = std::move(entry.second);
    owned->closeStream();
    MCPLINK_LOG_INFO("cancelling connect {} to {}", entry.first, owned->url());
    owned->complete(cancelledConnect(*owned));
    dispatcher_.deferredDelete(std::move(owned));
  }
  return cancelled.size();
}

}  // namespace transport
}  // namespace mcplink
