// ============================================================================
// LOGGER - Multi-Channel Structured Logging
// ============================================================================
// Multi-level logging (ERROR, WARN, INFO, DEBUG) fanned out to sinks:
// - Serial console            (SerialLogSink, firmware)
// - WebSocket broadcast       (WebSocketLogSink, firmware)
// - Buffered log file         (FileLogSink, firmware)
// - Capture buffer            (native tests)
//
// The logger itself has no Arduino dependency so every core module can log
// through the global `Log` accessor in both builds.
// ============================================================================

#ifndef LOGGER_H
#define LOGGER_H

#include <array>
#include <mutex>
#include <string>
#include "core/Types.h"

// ============================================================================
// LOG SINK INTERFACE
// ============================================================================
class LogSink {
public:
  virtual ~LogSink() = default;

  /**
   * Receive one formatted line
   * @param level Severity level
   * @param prefix Level prefix ("[ERROR] ", "[INFO]  ", ...)
   * @param message Raw message (without prefix)
   */
  virtual void write(LogLevel level, const char* prefix, const std::string& message) = 0;
};

// ============================================================================
// LOGGER CLASS
// ============================================================================
class Logger {
public:
  static constexpr int MAX_SINKS = 4;

  static Logger& getInstance();

  // ========================================================================
  // SINK MANAGEMENT
  // ========================================================================

  /** Attach a sink (not owned). @return false if all slots are taken */
  bool addSink(LogSink* sink);

  /** Detach a sink previously added (no-op if unknown) */
  void removeSink(LogSink* sink);

  // ========================================================================
  // LOGGING INTERFACE
  // ========================================================================

  void log(LogLevel level, const std::string& message);

  void error(const std::string& message) { log(LogLevel::LOG_ERROR, message); }
  void warn(const std::string& message)  { log(LogLevel::LOG_WARNING, message); }
  void info(const std::string& message)  { log(LogLevel::LOG_INFO, message); }
  void debug(const std::string& message) { log(LogLevel::LOG_DEBUG, message); }

  // ========================================================================
  // LOG LEVEL MANAGEMENT
  // ========================================================================

  void setLogLevel(LogLevel level) { _currentLogLevel = level; }
  LogLevel getLogLevel() const { return _currentLogLevel; }

  /** Fast check for hot-path debug guards */
  bool isDebugEnabled() const { return _loggingEnabled && _currentLogLevel >= LogLevel::LOG_DEBUG; }

  void setLoggingEnabled(bool enabled) { _loggingEnabled = enabled; }
  bool isLoggingEnabled() const { return _loggingEnabled; }

  /** Level prefix string ([ERROR], [WARN], etc.) */
  static const char* getLevelPrefix(LogLevel level);

  /** Level name for JSON payloads ("ERROR", "WARN", ...) */
  static const char* getLevelName(LogLevel level);

  /** Parse "error" / "warn" / "info" / "debug" (case-insensitive) */
  static bool parseLevel(const std::string& name, LogLevel& out);

private:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  std::array<LogSink*, MAX_SINKS> _sinks{};
  std::mutex _sinkMutex;

  LogLevel _currentLogLevel = LogLevel::LOG_INFO;
  bool _loggingEnabled = true;
};

// ============================================================================
// GLOBAL ACCESSOR
// ============================================================================
extern Logger& Log;

#endif // LOGGER_H
