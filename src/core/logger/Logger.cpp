// ============================================================================
// LOGGER IMPLEMENTATION
// ============================================================================

#include "core/logger/Logger.h"
#include <algorithm>
#include <cctype>

// ============================================================================
// SINGLETON INSTANCE
// ============================================================================

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

// Global accessor
Logger& Log = Logger::getInstance();

// ============================================================================
// SINK MANAGEMENT
// ============================================================================

bool Logger::addSink(LogSink* sink) {
  if (!sink) return false;
  std::lock_guard<std::mutex> lock(_sinkMutex);

  if (std::find(_sinks.begin(), _sinks.end(), sink) != _sinks.end()) return true;

  for (auto& slot : _sinks) {
    if (slot == nullptr) {
      slot = sink;
      return true;
    }
  }
  return false;
}

void Logger::removeSink(LogSink* sink) {
  std::lock_guard<std::mutex> lock(_sinkMutex);
  for (auto& slot : _sinks) {
    if (slot == sink) slot = nullptr;
  }
}

// ============================================================================
// LOGGING
// ============================================================================

void Logger::log(LogLevel level, const std::string& message) {
  if (!_loggingEnabled) return;
  if (level > _currentLogLevel) return;

  const char* prefix = getLevelPrefix(level);

  // Sinks are called under the mutex: a sink may not log back into Log
  std::lock_guard<std::mutex> lock(_sinkMutex);
  for (LogSink* sink : _sinks) {
    if (sink) sink->write(level, prefix, message);
  }
}

// ============================================================================
// LEVEL HELPERS
// ============================================================================

const char* Logger::getLevelPrefix(LogLevel level) {
  using enum LogLevel;
  switch (level) {
    case LOG_ERROR:   return "[ERROR] ";
    case LOG_WARNING: return "[WARN]  ";
    case LOG_INFO:    return "[INFO]  ";
    case LOG_DEBUG:   return "[DEBUG] ";
    default:          return "[LOG]   ";
  }
}

const char* Logger::getLevelName(LogLevel level) {
  static constexpr std::array levelNames = {"ERROR", "WARN", "INFO", "DEBUG"};
  auto levelIdx = static_cast<int>(level);
  return (levelIdx >= 0 && levelIdx <= 3) ? levelNames[levelIdx] : "INFO";
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  using enum LogLevel;
  if (lower == "error") { out = LOG_ERROR; return true; }
  if (lower == "warn" || lower == "warning") { out = LOG_WARNING; return true; }
  if (lower == "info") { out = LOG_INFO; return true; }
  if (lower == "debug") { out = LOG_DEBUG; return true; }
  return false;
}
