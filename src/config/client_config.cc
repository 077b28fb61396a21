#include "mcplink/config/client_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <yaml-cpp/yaml.h>

#define MCPLINK_LOG_COMPONENT ::mcplink::logging::Component::Config
#include "mcplink/logging/log_macros.h"

namespace mcplink {
namespace config {

namespace {

optional<std::string> processEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (!value) {
    return nullopt;
  }
  return std::string(value);
}

VoidResult configError(const std::string& message) {
  return makeVoidError(Error(ErrorKind::InvalidArgument, message));
}

Result<int64_t> parseMillis(const std::string& name, const std::string& text) {
  try {
    size_t used = 0;
    long long value = std::stoll(text, &used);
    if (used != text.size() || value < 0) {
      throw std::invalid_argument(text);
    }
    return static_cast<int64_t>(value);
  } catch (const std::logic_error&) {
    return makeError<int64_t>(ErrorKind::InvalidArgument,
                              name + " must be a non-negative integer, got '" +
                                  text + "'");
  }
}

}  // namespace

VoidResult ClientConfig::validate() const {
  if (client_id.empty()) {
    return configError("client_id must not be empty");
  }
  if (request_timeout.count() < 0 || connect_timeout.count() < 0 ||
      http_timeout.count() < 0 || sse_retry.count() < 0 ||
      kill_grace.count() < 0) {
    return configError("durations must not be negative");
  }
  if (http_workers == 0) {
    return configError("http_workers must be at least 1");
  }
  return makeVoidSuccess();
}

ConfigLoader::ConfigLoader() : env_(&processEnv) {}

ConfigLoader::ConfigLoader(EnvLookup env) : env_(std::move(env)) {}

Result<ClientConfig> ConfigLoader::load(
    const optional<std::string>& path) const {
  ClientConfig config;

  optional<std::string> file = path;
  if (!file) {
    file = env_("MCP_CLIENT_CONFIG");
  }
  if (file && !file->empty()) {
    auto file_result = applyFile(*file, config);
    if (const Error* err = get_error(file_result)) {
      return *err;
    }
  }

  auto env_result = applyEnvironment(config);
  if (const Error* err = get_error(env_result)) {
    return *err;
  }

  auto valid = config.validate();
  if (const Error* err = get_error(valid)) {
    return *err;
  }
  return config;
}

VoidResult ConfigLoader::applyFile(const std::string& path,
                                   ClientConfig& config) const {
  std::ifstream in(path);
  if (!in) {
    return configError("cannot read config file: " + path);
  }
  std::stringstream content;
  content << in.rdbuf();
  MCPLINK_LOG_DEBUG("loading configuration from {}", path);
  return applyYaml(content.str(), config);
}

VoidResult ConfigLoader::applyYaml(const std::string& text,
                                   ClientConfig& config) const {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::ParserException& e) {
    return configError(std::string("invalid YAML: ") + e.what());
  }
  if (root.IsNull()) {
    return makeVoidSuccess();
  }
  if (!root.IsMap()) {
    return configError("configuration root must be a mapping");
  }

  try {
    for (const auto& entry : root) {
      const std::string key = entry.first.as<std::string>();
      const YAML::Node& value = entry.second;

      if (key == "client_id") {
        config.client_id = value.as<std::string>();
      } else if (key == "connection_token") {
        config.connection_token = value.as<std::string>();
      } else if (key == "log_level") {
        auto level = logging::parseLogLevel(value.as<std::string>());
        if (!level) {
          return configError("unknown log_level: " + value.as<std::string>());
        }
        config.log_level = *level;
      } else if (key == "request_timeout_ms") {
        config.request_timeout = std::chrono::milliseconds(value.as<int64_t>());
      } else if (key == "connect_timeout_ms") {
        config.connect_timeout = std::chrono::milliseconds(value.as<int64_t>());
      } else if (key == "http_timeout_ms") {
        config.http_timeout = std::chrono::milliseconds(value.as<int64_t>());
      } else if (key == "sse_retry_ms") {
        config.sse_retry = std::chrono::milliseconds(value.as<int64_t>());
      } else if (key == "sse_max_reconnect_attempts") {
        config.sse_max_reconnect_attempts = value.as<uint32_t>();
      } else if (key == "kill_grace_ms") {
        config.kill_grace = std::chrono::milliseconds(value.as<int64_t>());
      } else if (key == "user_agent") {
        config.user_agent = value.as<std::string>();
      } else if (key == "http_workers") {
        config.http_workers = value.as<uint32_t>();
      } else if (key == "stderr_tail_bytes") {
        config.stderr_tail_bytes = value.as<size_t>();
      } else {
        MCPLINK_LOG_WARNING("ignoring unknown configuration key '{}'", key);
      }
    }
  } catch (const YAML::Exception& e) {
    return configError(std::string("invalid configuration value: ") + e.what());
  }
  return makeVoidSuccess();
}

VoidResult ConfigLoader::applyEnvironment(ClientConfig& config) const {
  if (auto value = env_("MCP_CLIENT_ID")) {
    if (!value->empty()) {
      config.client_id = *value;
    }
  }
  if (auto value = env_("MCP_CONNECTION_TOKEN")) {
    config.connection_token = *value;
  }
  if (auto value = env_("MCP_LOG_LEVEL")) {
    auto level = logging::parseLogLevel(*value);
    if (!level) {
      return configError("MCP_LOG_LEVEL has unknown level '" + *value + "'");
    }
    config.log_level = *level;
  }
  if (auto value = env_("MCP_REQUEST_TIMEOUT_MS")) {
    auto millis = parseMillis("MCP_REQUEST_TIMEOUT_MS", *value);
    if (const Error* err = get_error(millis)) {
      return makeVoidError(*err);
    }
    config.request_timeout = std::chrono::milliseconds(get<int64_t>(millis));
  }
  if (auto value = env_("MCP_CONNECT_TIMEOUT_MS")) {
    auto millis = parseMillis("MCP_CONNECT_TIMEOUT_MS", *value);
    if (const Error* err = get_error(millis)) {
      return makeVoidError(*err);
    }
    config.connect_timeout = std::chrono::milliseconds(get<int64_t>(millis));
  }
  return makeVoidSuccess();
}

}  // namespace config
}  // namespace mcplink
