#ifndef MCPLINK_HTTP_EVENT_STREAM_H
#define MCPLINK_HTTP_EVENT_STREAM_H

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

#include "mcplink/config/client_config.h"
#include "mcplink/http/sse_parser.h"

namespace mcplink {
namespace event {
class Dispatcher;
}

namespace http {

enum class ReadyState { Connecting, Open, Closed };

const char* readyStateName(ReadyState state);

/**
 * Events of one push stream, delivered on the dispatcher thread. Nothing
 * is delivered after EventStream::close() returns.
 */
class EventStreamCallbacks {
 public:
  virtual ~EventStreamCallbacks() = default;

  virtual void onOpen() = 0;
  virtual void onMessage(const SseEvent& event) = 0;
  // readyState() tells whether the stream is reconnecting (Connecting)
  // or gone for good (Closed)
  virtual void onError(const std::string& reason) = 0;
};

class EventStream {
 public:
  virtual ~EventStream() = default;

  virtual void close() = 0;
  virtual ReadyState readyState() const = 0;
};

using EventStreamPtr = std::unique_ptr<EventStream>;

struct EventStreamOptions {
  std::string url;
  std::map<std::string, std::string> headers;
  // Delay before reconnecting unless the server sent "retry:"
  std::chrono::milliseconds retry{3000};
  uint32_t max_reconnect_attempts{3};
};

class EventStreamFactory {
 public:
  virtual ~EventStreamFactory() = default;

  virtual EventStreamPtr open(const EventStreamOptions& options,
                              EventStreamCallbacks& callbacks) = 0;
};

/**
 * Opens text/event-stream GETs with libcurl, one thread per stream.
 *
 * A dropped stream is retried with Last-Event-ID up to the configured
 * number of attempts; a response other than 200 closes it for good.
 */
class CurlEventStreamFactory : public EventStreamFactory {
 public:
  CurlEventStreamFactory(event::Dispatcher& dispatcher,
                         const config::ClientConfig& config);

  EventStreamPtr open(const EventStreamOptions& options,
                      EventStreamCallbacks& callbacks) override;

 private:
  event::Dispatcher& dispatcher_;
  const std::string user_agent_;
  const std::chrono::milliseconds connect_timeout_;
};

}  // namespace http
}  // namespace mcplink

#endif  // MCPLINK_HTTP_EVENT_STREAM_H
