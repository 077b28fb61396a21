#include "mcplink/logging/log_sink.h"

#include <iostream>
#include <stdexcept>

namespace mcplink {
namespace logging {

void LogSink::setFormatter(std::unique_ptr<Formatter> formatter) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (formatter) {
    formatter_ = std::move(formatter);
  }
}

std::string LogSink::render(const LogMessage& msg) const {
  return formatter_->format(msg);
}

void StdioSink::log(const LogMessage& msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream << render(msg) << '\n';
  if (msg.level >= LogLevel::Error) {
    stream.flush();
  }
}

void StdioSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
  stream.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? std::ios::out | std::ios::app
                         : std::ios::out | std::ios::trunc) {
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + path);
  }
}

FileSink::~FileSink() {
  std::lock_guard<std::mutex> lock(mutex_);
  file_.flush();
}

void FileSink::log(const LogMessage& msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  file_ << render(msg) << '\n';
}

void FileSink::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  file_.flush();
}

void ExternalSink::log(const LogMessage& msg) {
  std::string formatted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    formatted = render(msg);
  }
  if (callback_) {
    callback_(msg, formatted);
  }
}

}  // namespace logging
}  // namespace mcplink
