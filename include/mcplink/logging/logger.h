#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "mcplink/logging/log_level.h"
#include "mcplink/logging/log_message.h"
#include "mcplink/logging/log_sink.h"

namespace mcplink {
namespace logging {

class Logger {
 public:
  Logger(const std::string& name, Component component = Component::Root)
      : name_(name), component_(component) {}

  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.component = component_;
    msg.logger_name = name_;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    try {
      msg.message =
          fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    } catch (const fmt::format_error& e) {
      msg.message = std::string(fmt) + " <format error: " + e.what() + ">";
    }
    write(msg);
  }

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    log(LogLevel::Debug, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    log(LogLevel::Info, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    log(LogLevel::Warning, nullptr, 0, nullptr, fmt,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    log(LogLevel::Error, nullptr, 0, nullptr, fmt, std::forward<Args>(args)...);
  }

  bool shouldLog(LogLevel level) const {
    LogLevel current = level_.load(std::memory_order_relaxed);
    return current != LogLevel::Off && level >= current;
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  const std::string& getName() const { return name_; }
  Component getComponent() const { return component_; }

  void flush() {
    auto sink = getSink();
    if (sink) {
      sink->flush();
    }
  }

 private:
  void write(const LogMessage& msg) {
    auto sink = getSink();
    if (sink) {
      sink->log(msg);
    }
  }

  const std::string name_;
  const Component component_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  mutable std::mutex sink_mutex_;
  std::shared_ptr<LogSink> sink_;
};

}  // namespace logging
}  // namespace mcplink
