#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplink/logging/logger.h"

namespace mcplink {
namespace logging {

/**
 * Process-wide table of named loggers.
 *
 * Logger names are "mcplink.<component>". A level set for a component
 * overrides the global level for that component's logger. Every logger
 * shares the registry's sink unless one is set on it directly.
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(Component component);
  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  bool shouldLog(Component component, LogLevel level);

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setComponentLevel(Component component, LogLevel level);
  // Removes all component overrides
  void clearComponentLevels();

  // Replaces the sink of every logger created through the registry
  void setSink(std::shared_ptr<LogSink> sink);
  std::shared_ptr<LogSink> getSink() const;

  std::vector<std::string> getLoggerNames() const;

  static std::string loggerName(Component component);

 private:
  LoggerRegistry();

  LogLevel effectiveLevelLocked(Component component) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<std::shared_ptr<Logger>> component_loggers_;
  std::map<Component, LogLevel> component_levels_;
  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
};

}  // namespace logging
}  // namespace mcplink
