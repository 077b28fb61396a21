#pragma once

#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "mcplink/logging/log_formatter.h"
#include "mcplink/logging/log_message.h"

namespace mcplink {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  void setFormatter(std::unique_ptr<Formatter> formatter);

 protected:
  std::string render(const LogMessage& msg) const;

  mutable std::mutex mutex_;
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Writes to stderr by default. stdout is reserved for protocol data in most
// MCP hosts, so Stdout must be chosen explicitly.
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  Target target_;
};

class FileSink : public LogSink {
 public:
  // Throws std::runtime_error if the file cannot be opened
  explicit FileSink(const std::string& path, bool append = true);
  ~FileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  std::ofstream file_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
};

// Forwards every message to a callback (embedding hosts, tests)
class ExternalSink : public LogSink {
 public:
  using Callback = std::function<void(const LogMessage& msg,
                                      const std::string& formatted)>;

  explicit ExternalSink(Callback cb) : callback_(std::move(cb)) {}

  void log(const LogMessage& msg) override;
  void flush() override {}

 private:
  Callback callback_;
};

}  // namespace logging
}  // namespace mcplink
