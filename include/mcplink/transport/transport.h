#ifndef MCPLINK_TRANSPORT_TRANSPORT_H
#define MCPLINK_TRANSPORT_TRANSPORT_H

#include <functional>
#include <string>

#include "mcplink/core/compat.h"
#include "mcplink/core/error.h"
#include "mcplink/json/json_bridge.h"
#include "mcplink/protocol/mcp_message.h"

namespace mcplink {
namespace transport {

enum class TransportKind { Stdio, Sse };

const char* transportKindName(TransportKind kind);

/**
 * A message the remote side sent that is not the answer to a pending
 * request: notifications, responses with unknown ids, or non-JSON text
 * (message unset, raw holds the text).
 */
struct InboundMessage {
  std::string connection_id;
  optional<json::JsonValue> message;
  std::string raw;
};

using MessageHandler = std::function<void(const InboundMessage&)>;

class Transport;

/**
 * Registry-side hooks a transport reports connection lifecycle through.
 * Called on the dispatcher thread.
 */
class ConnectionLifecycle {
 public:
  virtual ~ConnectionLifecycle() = default;

  virtual void onConnectionOpened(const std::string& connection_id,
                                  TransportKind kind,
                                  const std::string& endpoint,
                                  Transport& transport) = 0;

  // The connection died on its own. The transport has already released
  // its handle; pending requests are still outstanding.
  virtual void onConnectionTerminated(const std::string& connection_id,
                                      const Error& reason) = 0;
};

/**
 * @brief Sending side of one transport kind.
 *
 * A transport owns the handles of all of its connections. Responses are
 * delivered to the RequestCorrelator it was built with.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  virtual TransportKind kind() const = 0;

  // Hands the request to the connection. Errors here mean nothing was
  // sent and no response will ever arrive.
  virtual VoidResult send(const std::string& connection_id,
                          const protocol::McpRequest& request) = 0;

  // Releases the connection's handle. False if the transport does not
  // know the id. Does not notify ConnectionLifecycle.
  virtual bool disconnect(const std::string& connection_id) = 0;
};

// Random RFC 4122 version 4 identifier
std::string generateConnectionId();

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_TRANSPORT_H
