#ifndef MCPLINK_TRANSPORT_FRAME_CODEC_H
#define MCPLINK_TRANSPORT_FRAME_CODEC_H

#include <cstddef>
#include <string>

#include "mcplink/json/json_bridge.h"

namespace mcplink {
namespace transport {

class FrameCodecCallbacks {
 public:
  virtual ~FrameCodecCallbacks() = default;

  // A complete line that parsed as JSON
  virtual void onFrame(const json::JsonValue& message) = 0;

  // A complete non-blank line that is not JSON, without its terminator
  virtual void onMalformedFrame(const std::string& line) = 0;
};

/**
 * Splits a byte stream into newline-delimited JSON messages.
 *
 * Chunks may split or join messages arbitrarily; incomplete trailing data
 * stays buffered until its newline arrives. Blank lines are dropped and a
 * trailing '\r' is ignored.
 */
class FrameCodec {
 public:
  explicit FrameCodec(FrameCodecCallbacks& callbacks);

  void feed(const char* data, size_t length);
  void feed(const std::string& data) { feed(data.data(), data.size()); }

  // Serializes one message followed by '\n'
  static std::string encode(const json::JsonValue& message);

  size_t bufferedBytes() const { return buffer_.size() - consumed_; }
  void reset();

 private:
  void dispatchLine(std::string line);

  FrameCodecCallbacks& callbacks_;
  std::string buffer_;
  size_t consumed_{0};
};

}  // namespace transport
}  // namespace mcplink

#endif  // MCPLINK_TRANSPORT_FRAME_CODEC_H
