#pragma once

#include <string>

#include "mcplink/logging/log_message.h"

namespace mcplink {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// "2024-01-01 12:00:00.123 [WARNING] [mcplink.stdio] text (file.cc:42)"
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;

 private:
  static std::string escapeJson(const std::string& str);
};

}  // namespace logging
}  // namespace mcplink
