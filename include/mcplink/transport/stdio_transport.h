#ifndef MCPLINK_TRANSPORT_STDIO_TRANSPORT_H
#define MCPLINK_TRANSPORT_STDIO_TRANSPORT_H

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplink/config/client_config.h"
#include "mcplink/event/event_loop.h"
#include "mcplink/process/child_process.h"
#include "mcplink/transport/request_correlator.h"
#include "mcplink/transport/transport.h"

namespace mcplink {
namespace transport {

struct StdioConnectParams {
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
};

/**
 * @brief Connections to MCP servers running as child processes.
 *
 * Requests are written to the child's stdin as one JSON line each; its
 * stdout is framed by a FrameCodec and responses are handed to the
 * correlator. A connection dies when the child exits or a pipe fails.
 * Disconnected children get SIGTERM, then SIGKILL after the configured
 * grace period, and are reaped in the background.
 */
class StdioTransport : public Transport {
 public:
  StdioTransport(event::Dispatcher& dispatcher,
                 process::ProcessLauncher& launcher,
                 RequestCorrelator& correlator,
                 ConnectionLifecycle& lifecycle,
                 const config::ClientConfig& config);
  ~StdioTransport() override;

  // Spawns the server. The connection is open and registered on success.
  Result<std::string> connect(const StdioConnectParams& params,
                              MessageHandler handler);

  TransportKind kind() const override { return TransportKind::Stdio; }
  VoidResult send(const std::string& connection_id,
                  const protocol::McpRequest& request) override;
  bool disconnect(const std::string& connection_id) override;

  size_t connectionCount() const { return connections_.size(); }
  // Children that were disconnected but have not exited yet
  size_t drainingCount() const { return draining_.size(); }

 private:
  class StdioConnection;
  friend class StdioConnection;

  void terminate(StdioConnection& connection, const Error& reason);
  void retire(StdioConnection& connection);
  void beginShutdown(std::unique_ptr<StdioConnection> connection);

  event::Dispatcher& dispatcher_;
  process::ProcessLauncher& launcher_;
  RequestCorrelator& correlator_;
  ConnectionLifecycle& lifecycle_;
  const config::ClientConfig& config_;

  std::unordered_map<std::string, std::unique_ptr<StdioConnection>>
      connections_;
  std::unordered_map<std::string, std::unique_ptr<StdioConnection>> draining_;
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_STDIO_TRANSPORT_H
