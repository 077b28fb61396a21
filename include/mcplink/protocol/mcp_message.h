#ifndef MCPLINK_PROTOCOL_MCP_MESSAGE_H
#define MCPLINK_PROTOCOL_MCP_MESSAGE_H

#include <string>
#include <vector>

#include "mcplink/core/compat.h"
#include "mcplink/core/error.h"
#include "mcplink/json/json_bridge.h"

namespace mcplink {
namespace protocol {

constexpr const char* kMethodListTools = "listTools";
constexpr const char* kMethodCallTool = "callTool";

/**
 * Outbound request. Serializes as {"id", "method", "params"?} in that
 * key order.
 */
struct McpRequest {
  std::string id;
  std::string method;
  optional<json::JsonValue> params;

  json::JsonValue toJson() const;
};

McpRequest makeListToolsRequest(const std::string& id);
McpRequest makeCallToolRequest(const std::string& id,
                               const std::string& tool_name,
                               const json::JsonValue& arguments);

struct ToolDefinition {
  std::string name;
  std::string description;
  json::JsonValue parameters_schema;
};

// Request id of an inbound message as text. Numeric ids are rendered in
// decimal; anything else yields nullopt.
optional<std::string> messageId(const json::JsonValue& message);

// Outcome carried by a response object: its "result" (null when absent),
// or a ProtocolError when "error" is truthy.
Result<json::JsonValue> responseOutcome(const json::JsonValue& message);

// Builds the ProtocolError for an "error" member of a response
Error protocolError(const json::JsonValue& error);

// Accepts an array of tool objects or an object with a "tools" array.
// The schema is read from "parametersSchema", falling back to
// "inputSchema".
Result<std::vector<ToolDefinition>> parseToolList(const json::JsonValue& result);

}  // namespace protocol
}  // namespace mcplink

#endif  // MCPLINK_PROTOCOL_MCP_MESSAGE_H
