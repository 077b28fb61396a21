#include "mcplink/logging/logger_registry.h"

#include <algorithm>
#include <cctype>

namespace mcplink {
namespace logging {

optional<LogLevel> parseLogLevel(const std::string& str) {
  std::string lower;
  lower.reserve(str.size());
  for (char c : str) {
    lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "debug") return LogLevel::Debug;
  if (lower == "info") return LogLevel::Info;
  if (lower == "notice") return LogLevel::Notice;
  if (lower == "warn" || lower == "warning") return LogLevel::Warning;
  if (lower == "error") return LogLevel::Error;
  if (lower == "critical") return LogLevel::Critical;
  if (lower == "alert") return LogLevel::Alert;
  if (lower == "emergency") return LogLevel::Emergency;
  if (lower == "off" || lower == "none") return LogLevel::Off;
  return nullopt;
}

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry()
    : component_loggers_(static_cast<size_t>(Component::Count)),
      sink_(std::make_shared<StdioSink>(StdioSink::Stderr)) {}

std::string LoggerRegistry::loggerName(Component component) {
  return std::string("mcplink.") + componentToString(component);
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    Component component) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = component_loggers_[static_cast<size_t>(component)];
  if (!slot) {
    const std::string name = loggerName(component);
    slot = std::make_shared<Logger>(name, component);
    slot->setLevel(effectiveLevelLocked(component));
    slot->setSink(sink_);
    loggers_[name] = slot;
  }
  return slot;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }
  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(global_level_);
  logger->setSink(sink_);
  loggers_[name] = logger;
  return logger;
}

bool LoggerRegistry::shouldLog(Component component, LogLevel level) {
  return getOrCreateLogger(component)->shouldLog(level);
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  for (auto& entry : loggers_) {
    Component component = entry.second->getComponent();
    if (component_levels_.count(component) == 0 ||
        component == Component::Root) {
      entry.second->setLevel(level);
    }
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setComponentLevel(Component component, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_[component] = level;
  auto& slot = component_loggers_[static_cast<size_t>(component)];
  if (slot) {
    slot->setLevel(level);
  }
}

void LoggerRegistry::clearComponentLevels() {
  std::lock_guard<std::mutex> lock(mutex_);
  component_levels_.clear();
  for (auto& entry : loggers_) {
    entry.second->setLevel(global_level_);
  }
}

void LoggerRegistry::setSink(std::shared_ptr<LogSink> sink) {
  if (!sink) {
    sink = std::make_shared<NullSink>();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = sink;
  for (auto& entry : loggers_) {
    entry.second->setSink(sink_);
  }
}

std::shared_ptr<LogSink> LoggerRegistry::getSink() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sink_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

LogLevel LoggerRegistry::effectiveLevelLocked(Component component) const {
  auto it = component_levels_.find(component);
  return it != component_levels_.end() ? it->second : global_level_;
}

}  // namespace logging
}  // namespace mcplink
