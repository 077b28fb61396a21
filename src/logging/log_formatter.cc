#include "mcplink/logging/log_formatter.h"

#include <ctime>
#include <sstream>

#include <fmt/format.h>

namespace mcplink {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&time_t, &tm_buf);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", buf, static_cast<int>(ms.count()));
}

std::string threadIdString(const std::thread::id& id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

const char* baseName(const char* path) {
  const char* base = path;
  for (const char* p = path; *p; ++p) {
    if (*p == '/') {
      base = p + 1;
    }
  }
  return base;
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  std::string out = fmt::format("{} [{}] [{}] {}", formatTimestamp(msg.timestamp),
                                logLevelToString(msg.level), msg.logger_name,
                                msg.message);
  if (msg.file && msg.line > 0) {
    out += fmt::format(" ({}:{})", baseName(msg.file), msg.line);
  }
  return out;
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  std::string out = fmt::format(
      "{{\"timestamp\":\"{}\",\"level\":\"{}\",\"logger\":\"{}\","
      "\"thread\":\"{}\",\"pid\":{}",
      formatTimestamp(msg.timestamp), logLevelToString(msg.level),
      escapeJson(msg.logger_name), threadIdString(msg.thread_id),
      msg.process_id);
  if (msg.component != Component::Root) {
    out += fmt::format(",\"component\":\"{}\"", componentToString(msg.component));
  }
  if (msg.file && msg.line > 0) {
    out += fmt::format(",\"file\":\"{}\",\"line\":{}",
                       escapeJson(baseName(msg.file)), msg.line);
  }
  out += fmt::format(",\"message\":\"{}\"}}", escapeJson(msg.message));
  return out;
}

std::string JsonFormatter::escapeJson(const std::string& str) {
  std::string out;
  out.reserve(str.size());
  for (char c : str) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          out += fmt::format("\\u{:04x}", static_cast<int>(c));
        } else {
          out += c;
        }
    }
  }
  return out;
}

}  // namespace logging
}  // namespace mcplink
