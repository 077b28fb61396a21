#include "mcplink/transport/frame_codec.h"

namespace mcplink {
namespace transport {

namespace {

bool isBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

FrameCodec::FrameCodec(FrameCodecCallbacks& callbacks)
    : callbacks_(callbacks) {}

void FrameCodec::feed(const char* data, size_t length) {
  if (length == 0) {
    return;
  }
  // Only bytes after the last newline can be incomplete
  size_t search_from = buffer_.size();
  buffer_.append(data, length);

  size_t newline;
  while ((newline = buffer_.find('\n', search_from)) != std::string::npos) {
    std::string line = buffer_.substr(consumed_, newline - consumed_);
    consumed_ = newline + 1;
    search_from = consumed_;
    dispatchLine(std::move(line));
  }

  if (consumed_ > 0) {
    buffer_.erase(0, consumed_);
    consumed_ = 0;
  }
}

std::string FrameCodec::encode(const json::JsonValue& message) {
  std::string line = message.toString();
  line.push_back('\n');
  return line;
}

void FrameCodec::reset() {
  buffer_.clear();
  consumed_ = 0;
}

void FrameCodec::dispatchLine(std::string line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  if (isBlank(line)) {
    return;
  }

  json::JsonValue message;
  try {
    message = json::JsonValue::parse(line);
  } catch (const json::JsonException&) {
    callbacks_.onMalformedFrame(line);
    return;
  }
  callbacks_.onFrame(message);
}

}  // namespace transport
}  // namespace mcplink
