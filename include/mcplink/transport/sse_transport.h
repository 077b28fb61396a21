#ifndef MCPLINK_TRANSPORT_SSE_TRANSPORT_H
#define MCPLINK_TRANSPORT_SSE_TRANSPORT_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

#include "mcplink/config/client_config.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/http/event_stream.h"
#include "mcplink/http/http_client.h"
#include "mcplink/transport/request_correlator.h"
#include "mcplink/transport/transport.h"

namespace mcplink {
namespace transport {

struct SseConnectParams {
  std::string url;
  // Extra headers for both the stream and the POSTs
  std::map<std::string, std::string> headers;
};

// Maps a POST response to the outcome of the request it answers
Result<json::JsonValue> httpOutcome(const http::HttpResponse& response);

/**
 * @brief Connections to MCP servers over HTTP.
 *
 * Each connection has a Server-Sent Events push stream and sends every
 * request as its own POST to the same URL. The POST's response body is
 * the response to that request; push messages only ever reach the
 * connection's message handler.
 */
class SseTransport : public Transport {
 public:
  using ConnectCallback = std::function<void(Result<std::string>)>;

  SseTransport(event::Dispatcher& dispatcher,
               http::HttpClient& http_client,
               http::EventStreamFactory& streams,
               RequestCorrelator& correlator,
               ConnectionLifecycle& lifecycle,
               const config::ClientConfig& config);
  ~SseTransport() override;

  // Completes once the stream opens, fails to open, or the connect
  // timeout elapses. The callback runs on the dispatcher thread, possibly
  // before connect() returns.
  void connect(const SseConnectParams& params,
               MessageHandler handler,
               ConnectCallback done);

  TransportKind kind() const override { return TransportKind::Sse; }
  VoidResult send(const std::string& connection_id,
                  const protocol::McpRequest& request) override;
  bool disconnect(const std::string& connection_id) override;

  // Fails every connect still waiting for its stream to open. Returns the
  // number cancelled.
  size_t cancelPendingConnects();

  size_t connectionCount() const { return connections_.size(); }
  size_t connectingCount() const { return connecting_.size(); }

 private:
  class SseConnection;
  friend class SseConnection;

  std::map<std::string, std::string> requestHeaders(
      const SseConnection& connection) const;

  void onOpened(SseConnection& connection);
  void onOpenFailed(SseConnection& connection, const std::string& reason);
  void onStreamClosed(SseConnection& connection, const std::string& reason);
  Error cancelledConnect(const SseConnection& connection) const;

  void onPostResponse(const std::string& connection_id,
                      const std::string& request_id,
                      const http::HttpResponse& response);

  event::Dispatcher& dispatcher_;
  http::HttpClient& http_client_;
  http::EventStreamFactory& streams_;
  RequestCorrelator& correlator_;
  ConnectionLifecycle& lifecycle_;
  const config::ClientConfig& config_;

  std::unordered_map<std::string, std::unique_ptr<SseConnection>> connecting_;
  std::unordered_map<std::string, std::unique_ptr<SseConnection>> connections_;
  // Lets HTTP completions detect that the transport is gone
  std::shared_ptr<bool> alive_;
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_SSE_TRANSPORT_H
