#ifndef MCPLINK_CONFIG_CLIENT_CONFIG_H
#define MCPLINK_CONFIG_CLIENT_CONFIG_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "mcplink/core/compat.h"
#include "mcplink/core/error.h"
#include "mcplink/logging/log_level.h"

namespace mcplink {
namespace config {

/**
 * Settings shared by the connection manager and its transports.
 *
 * Durations of zero disable the corresponding deadline.
 */
struct ClientConfig {
  std::string client_id{"mcplink-client"};
  // Sent as a bearer token on SSE streams and POSTs when non-empty
  std::string connection_token;
  logging::LogLevel log_level{logging::LogLevel::Info};

  std::chrono::milliseconds request_timeout{0};
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds http_timeout{60000};

  std::chrono::milliseconds sse_retry{3000};
  uint32_t sse_max_reconnect_attempts{3};

  // SIGTERM is escalated to SIGKILL after this long
  std::chrono::milliseconds kill_grace{2000};

  std::string user_agent{"mcplink/1.0"};
  uint32_t http_workers{2};
  size_t stderr_tail_bytes{4096};

  VoidResult validate() const;
};

/**
 * Builds a ClientConfig from, in increasing priority: defaults, a YAML
 * file, environment variables.
 *
 * Recognized variables: MCP_CLIENT_ID, MCP_CONNECTION_TOKEN, MCP_LOG_LEVEL,
 * MCP_REQUEST_TIMEOUT_MS, MCP_CONNECT_TIMEOUT_MS. MCP_CLIENT_CONFIG names
 * the YAML file when no path is given.
 */
class ConfigLoader {
 public:
  using EnvLookup = std::function<optional<std::string>(const std::string&)>;

  ConfigLoader();
  explicit ConfigLoader(EnvLookup env);

  Result<ClientConfig> load(const optional<std::string>& path = nullopt) const;

  // Overlays a YAML file. Unknown keys are logged and ignored.
  VoidResult applyFile(const std::string& path, ClientConfig& config) const;
  VoidResult applyYaml(const std::string& text, ClientConfig& config) const;

  VoidResult applyEnvironment(ClientConfig& config) const;

 private:
  EnvLookup env_;
};

}  // namespace config
}  // namespace mcplink

#endif  // MCPLINK_CONFIG_CLIENT_CONFIG_H
