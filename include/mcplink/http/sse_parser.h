#ifndef MCPLINK_HTTP_SSE_PARSER_H
#define MCPLINK_HTTP_SSE_PARSER_H

#include <cstdint>
#include <string>

#include "mcplink/core/compat.h"

namespace mcplink {
namespace http {

/**
 * One dispatched Server-Sent Event.
 */
struct SseEvent {
  optional<std::string> id;
  optional<std::string> event;
  // Multiple data lines joined with '\n'
  std::string data;
  optional<uint64_t> retry;
};

class SseParserCallbacks {
 public:
  virtual ~SseParserCallbacks() = default;

  virtual void onSseEvent(const SseEvent& event) = 0;
  virtual void onSseComment(const std::string& comment) = 0;
};

/**
 * Incremental text/event-stream parser.
 *
 * Accepts CR, LF and CRLF line endings, including a CRLF split across two
 * chunks. A leading UTF-8 BOM is skipped. Events without any data field
 * are not dispatched; unknown fields are ignored. Not thread-safe.
 */
class SseParser {
 public:
  explicit SseParser(SseParserCallbacks& callbacks);

  void feed(const char* data, size_t length);
  void feed(const std::string& data) { feed(data.data(), data.size()); }

  // Clears partial state for a new stream. The last event id survives so
  // it can be sent as Last-Event-ID on reconnect.
  void reset();

  const std::string& lastEventId() const { return last_event_id_; }
  // Reconnection delay announced by the server, if any
  optional<uint64_t> retry() const { return retry_; }

 private:
  void processLine(const std::string& line);
  void processField(const std::string& name, const std::string& value);
  void dispatch();

  SseParserCallbacks& callbacks_;
  std::string line_;
  SseEvent pending_;
  bool has_data_{false};
  bool skipped_bom_{false};
  bool after_cr_{false};
  std::string last_event_id_;
  optional<uint64_t> retry_;
};

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_SSE_PARSER_H
