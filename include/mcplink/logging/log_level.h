#pragma once

#include <cstdint>
#include <string>

#include "mcplink/core/compat.h"

namespace mcplink {
namespace logging {

// RFC-5424 severities
enum class LogLevel : uint8_t {
  Debug = 0,
  Info = 1,
  Notice = 2,
  Warning = 3,
  Error = 4,
  Critical = 5,
  Alert = 6,
  Emergency = 7,
  Off = 8
};

// Subsystems that own a logger
enum class Component {
  Root,
  Client,
  Registry,
  Correlator,
  Stdio,
  Sse,
  Http,
  Process,
  Config,
  Event,
  Count
};

inline const char* logLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Notice: return "NOTICE";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    case LogLevel::Alert: return "ALERT";
    case LogLevel::Emergency: return "EMERGENCY";
    case LogLevel::Off: return "OFF";
  }
  return "UNKNOWN";
}

// Accepts upper or lower case; "warn" is an alias for warning
optional<LogLevel> parseLogLevel(const std::string& str);

inline const char* componentToString(Component component) {
  switch (component) {
    case Component::Root: return "root";
    case Component::Client: return "client";
    case Component::Registry: return "registry";
    case Component::Correlator: return "correlator";
    case Component::Stdio: return "stdio";
    case Component::Sse: return "sse";
    case Component::Http: return "http";
    case Component::Process: return "process";
    case Component::Config: return "config";
    case Component::Event: return "event";
    case Component::Count: break;
  }
  return "unknown";
}

}  // namespace logging
}  // namespace mcplink
