#include "mcplink/protocol/mcp_message.h"

namespace mcplink {
namespace protocol {

json::JsonValue McpRequest::toJson() const {
  json::JsonObjectBuilder builder;
  builder.add("id", id).add("method", method);
  if (params) {
    builder.add("params", *params);
  }
  return builder.build();
}

McpRequest makeListToolsRequest(const std::string& id) {
  McpRequest request;
  request.id = id;
  request.method = kMethodListTools;
  return request;
}

McpRequest makeCallToolRequest(const std::string& id,
                               const std::string& tool_name,
                               const json::JsonValue& arguments) {
  McpRequest request;
  request.id = id;
  request.method = kMethodCallTool;
  request.params = json::JsonObjectBuilder()
                       .add("toolName", tool_name)
                       .add("arguments", arguments)
                       .build();
  return request;
}

optional<std::string> messageId(const json::JsonValue& message) {
  if (!message.isObject() || !message.contains("id")) {
    return nullopt;
  }
  json::JsonValue id = message.get("id");
  if (id.isString()) {
    std::string text = id.getString();
    if (text.empty()) {
      return nullopt;
    }
    return text;
  }
  if (id.isInteger()) {
    return std::to_string(id.getInt64());
  }
  return nullopt;
}

Error protocolError(const json::JsonValue& error) {
  int code = 0;
  if (error.isObject() && error.contains("code") &&
      error.get("code").isNumber()) {
    code = error.get("code").getInt();
  }
  return Error(ErrorKind::ProtocolError, "MCP error: " + error.toString(),
               code, error);
}

Result<json::JsonValue> responseOutcome(const json::JsonValue& message) {
  if (message.contains("error") && message.get("error").truthy()) {
    return protocolError(message.get("error"));
  }
  if (message.contains("result")) {
    return message.get("result");
  }
  return json::JsonValue::null();
}

Result<std::vector<ToolDefinition>> parseToolList(const json::JsonValue& result) {
  json::JsonValue list = result;
  if (result.isObject() && result.contains("tools")) {
    list = result.get("tools");
  }
  if (!list.isArray()) {
    return makeError<std::vector<ToolDefinition>>(
        ErrorKind::InvalidResponse,
        "listTools result is not a tool list: " + result.toString());
  }

  std::vector<ToolDefinition> tools;
  tools.reserve(list.size());
  for (size_t i = 0; i < list.size(); ++i) {
    json::JsonValue entry = list.at(i);
    if (!entry.isObject() || !entry.contains("name") ||
        !entry.get("name").isString()) {
      return makeError<std::vector<ToolDefinition>>(
          ErrorKind::InvalidResponse,
          "tool entry " + std::to_string(i) + " has no name");
    }
    ToolDefinition tool;
    tool.name = entry.get("name").getString();
    if (entry.contains("description")) {
      tool.description = entry.get("description").getString("");
    }
    if (entry.contains("parametersSchema")) {
      tool.parameters_schema = entry.get("parametersSchema");
    } else if (entry.contains("inputSchema")) {
      tool.parameters_schema = entry.get("inputSchema");
    }
    tools.push_back(std::move(tool));
  }
  return tools;
}

}  // namespace protocol
}  // namespace mcplink
