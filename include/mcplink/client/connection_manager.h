/**
 * @file connection_manager.h
 * @brief Client-side manager for connections to MCP tool servers
 *
 * Owns one transport per kind (stdio child processes, HTTP with an SSE
 * push stream), the registry of live connections and the correlator of
 * in-flight calls. Tool calls are exposed as futures.
 */

#ifndef MCPLINK_CLIENT_CONNECTION_MANAGER_H
#define MCPLINK_CLIENT_CONNECTION_MANAGER_H

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "mcplink/client/connection_registry.h"
#include "mcplink/config/client_config.h"
#include "mcplink/core/compat.h"
#include "mcplink/core/error.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/http/event_stream.h"
#include "mcplink/http/http_client.h"
#include "mcplink/json/json_bridge.h"
#include "mcplink/process/child_process.h"
#include "mcplink/protocol/mcp_message.h"
#include "mcplink/transport/request_correlator.h"
#include "mcplink/transport/sse_transport.h"
#include "mcplink/transport/stdio_transport.h"

namespace mcplink {
namespace client {

struct ConnectParams {
  transport::TransportKind kind{transport::TransportKind::Stdio};
  transport::StdioConnectParams stdio_params;
  transport::SseConnectParams sse_params;
  // Receives everything the server sends that does not answer a call
  transport::MessageHandler on_message;

  static ConnectParams forStdio(const std::string& command,
                                const std::vector<std::string>& args = {});
  static ConnectParams forSse(const std::string& url);
};

struct CallOptions {
  // Overrides ClientConfig::request_timeout; zero disables the deadline
  optional<std::chrono::milliseconds> timeout;
};

// Connection id and the failure that closed it
using ConnectionClosedObserver =
    std::function<void(const std::string&, const Error&)>;

/**
 * @brief Connects to MCP servers and invokes their tools.
 *
 * All state lives on the dispatcher thread. Public methods may be called
 * from any thread: on the dispatcher thread they run inline, so the
 * returned future may already be ready; elsewhere the work is posted and
 * the dispatcher must be running. Never block on a future from the
 * dispatcher thread.
 *
 * Failed futures throw ConnectionError.
 *
 * Example:
 * @code
 *   auto id = manager.connect(ConnectParams::forStdio("node",
 *                                                     {"server.js"})).get();
 *   auto sum = manager.callTool(id, "sum",
 *                               json::JsonObjectBuilder()
 *                                   .add("a", 2).add("b", 3).build()).get();
 * @endcode
 */
class ConnectionManager : public transport::ConnectionLifecycle {
 public:
  ConnectionManager(event::Dispatcher& dispatcher,
                    const config::ClientConfig& config,
                    process::ProcessLauncher& launcher,
                    http::HttpClient& http_client,
                    http::EventStreamFactory& streams);

  // Closes whatever is still connected. Destroy on the dispatcher thread,
  // or after the dispatcher has stopped.
  ~ConnectionManager() override;

  ConnectionManager(const ConnectionManager&) = delete;
  ConnectionManager& operator=(const ConnectionManager&) = delete;

  // Resolves with the new connection id once the server is reachable
  std::future<std::string> connect(const ConnectParams& params);

  // Resolves false when the id is not connected
  std::future<bool> disconnect(const std::string& connection_id);

  std::future<std::vector<protocol::ToolDefinition>> listTools(
      const std::string& connection_id,
      const CallOptions& options = CallOptions());

  std::future<json::JsonValue> callTool(
      const std::string& connection_id,
      const std::string& tool_name,
      const json::JsonValue& arguments,
      const CallOptions& options = CallOptions());

  // Best effort; failures are logged. Blocks until done when called off
  // the dispatcher thread.
  void closeAllConnections();

  std::vector<std::string> getActiveStdioConnectionIds() const;
  std::vector<std::string> getActiveSseConnectionIds() const;

  // Called on the dispatcher thread when a connection dies on its own
  void setConnectionClosedObserver(ConnectionClosedObserver observer);

  const ConnectionRegistry& registry() const { return registry_; }
  // Dispatcher thread only
  const transport::RequestCorrelator& correlator() const {
    return correlator_;
  }

  // transport::ConnectionLifecycle
  void onConnectionOpened(const std::string& connection_id,
                          transport::TransportKind kind,
                          const std::string& endpoint,
                          transport::Transport& transport) override;
  void onConnectionTerminated(const std::string& connection_id,
                              const Error& reason) override;

 private:
  using RequestFactory =
      std::function<protocol::McpRequest(const std::string& request_id)>;

  void runOnDispatcher(std::function<void()> work);

  void sendRequest(const std::string& connection_id,
                   const RequestFactory& make_request,
                   const CallOptions& options,
                   transport::ResultCallback on_result,
                   transport::ErrorCallback on_error);

  bool closeConnection(const std::string& connection_id);
  void closeAll();

  event::Dispatcher& dispatcher_;
  const config::ClientConfig config_;
  ConnectionRegistry registry_;
  transport::RequestCorrelator correlator_;
  std::unique_ptr<transport::StdioTransport> stdio_;
  std::unique_ptr<transport::SseTransport> sse_;
  ConnectionClosedObserver closed_observer_;
  // Posted work is dropped once the manager is gone
  std::shared_ptr<bool> alive_;
};

}  // namespace client
}  // namespace mcplink

#endif  // MCPLINK_CLIENT_CONNECTION_MANAGER_H
