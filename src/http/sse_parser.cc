#include "mcplink/http/sse_parser.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mcplink {
namespace http {

namespace {

const char kBom[] = "\xEF\xBB\xBF";

bool allDigits(const std::string& text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](unsigned char c) {
           return std::isdigit(c) != 0;
         });
}

}  // namespace

SseParser::SseParser(SseParserCallbacks& callbacks) : callbacks_(callbacks) {}

void SseParser::feed(const char* data, size_t length) {
  if (!skipped_bom_) {
    // The BOM may arrive split; hold bytes until we can decide
    line_.append(data, length);
    if (line_.size() < 3 &&
        std::equal(line_.begin(), line_.end(), kBom)) {
      return;
    }
    skipped_bom_ = true;
    std::string head;
    head.swap(line_);
    if (head.compare(0, 3, kBom) == 0) {
      head.erase(0, 3);
    }
    feed(head.data(), head.size());
    return;
  }

  for (size_t i = 0; i < length; ++i) {
    const char c = data[i];
    if (c == '\n') {
      if (after_cr_) {
        after_cr_ = false;
        continue;
      }
      processLine(line_);
      line_.clear();
    } else if (c == '\r') {
      after_cr_ = true;
      processLine(line_);
      line_.clear();
    } else {
      after_cr_ = false;
      line_ += c;
    }
  }
}

void SseParser::reset() {
  line_.clear();
  pending_ = SseEvent();
  has_data_ = false;
  skipped_bom_ = false;
  after_cr_ = false;
}

void SseParser::processLine(const std::string& line) {
  if (line.empty()) {
    dispatch();
    return;
  }
  if (line[0] == ':') {
    callbacks_.onSseComment(line.substr(1));
    return;
  }

  const size_t colon = line.find(':');
  if (colon == std::string::npos) {
    processField(line, std::string());
    return;
  }
  size_t value_start = colon + 1;
  if (value_start < line.size() && line[value_start] == ' ') {
    ++value_start;
  }
  processField(line.substr(0, colon), line.substr(value_start));
}

void SseParser::processField(const std::string& name,
                             const std::string& value) {
  if (name == "data") {
    if (has_data_) {
      pending_.data += '\n';
    }
    pending_.data += value;
    has_data_ = true;
  } else if (name == "event") {
    pending_.event = value;
  } else if (name == "id") {
    // Ids containing NUL are ignored
    if (value.find('\0') == std::string::npos) {
      pending_.id = value;
      last_event_id_ = value;
    }
  } else if (name == "retry") {
    if (allDigits(value)) {
      try {
        const uint64_t millis = std::stoull(value);
        pending_.retry = millis;
        retry_ = millis;
      } catch (const std::out_of_range&) {
        // Overlong values are ignored like any other malformed retry
      }
    }
  }
}

void SseParser::dispatch() {
  if (has_data_) {
    if (!pending_.id && !last_event_id_.empty()) {
      pending_.id = last_event_id_;
    }
    SseEvent event = std::move(pending_);
    pending_ = SseEvent();
    has_data_ = false;
    callbacks_.onSseEvent(event);
    return;
  }
  pending_ = SseEvent();
}

}  // namespace http
}  // namespace mcplink
