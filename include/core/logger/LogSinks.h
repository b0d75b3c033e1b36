// ============================================================================
// LOG SINKS - Firmware output channels for Logger
// ============================================================================
// - SerialLogSink:    prefix + message on the USB console
// - WebSocketLogSink: {"type":"log","level":...,"message":...} to companion
//                     clients of the events WebSocketsServer. Lines are
//                     queued by the logging task and broadcast by drain()
//                     on the task that runs the server loop.
// - FileLogSink:      circular buffer flushed to /logs/log_<date>_<n>.txt
// ============================================================================

#ifndef LOG_SINKS_H
#define LOG_SINKS_H

#include <Arduino.h>
#include <WebSocketsServer.h>
#include <LittleFS.h>
#include <array>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "core/Config.h"
#include "core/logger/Logger.h"
#include "core/logger/LogQueue.h"

class FileSystem;

constexpr const char* LOG_DIR = "/logs";
constexpr const char* LOG_FILE_PATTERN = "/logs/log_";
constexpr const char* LOG_FILE_EXTENSION = ".txt";

// ============================================================================
// SERIAL
// ============================================================================
class SerialLogSink : public LogSink {
public:
  void write(LogLevel level, const char* prefix, const std::string& message) override;
};

// ============================================================================
// WEBSOCKET BROADCAST
// ============================================================================
class WebSocketLogSink : public LogSink {
public:
  explicit WebSocketLogSink(WebSocketsServer& ws)
    : _ws(ws), _pending(LOG_BROADCAST_QUEUE_SIZE) {}

  /** Queues WARN and above, safe from any task */
  void write(LogLevel level, const char* prefix, const std::string& message) override;

  /** Broadcast queued lines. Only from the task calling _ws.loop() */
  void drain();

private:
  WebSocketsServer& _ws;
  LogQueue _pending;
};

// ============================================================================
// BUFFERED FILE
// ============================================================================
struct LogEntry {
  unsigned long timestamp = 0;  // millis() when log was created
  std::string line;             // prefix + message

  LogEntry() = default;
};

class FileLogSink : public LogSink {
public:
  explicit FileLogSink(FileSystem& fs);

  void write(LogLevel level, const char* prefix, const std::string& message) override;

  /**
   * Initialize log file (creates /logs dir, opens session file)
   * Must be called after FileSystem::mount() and NTP sync
   * @return true if log file opened successfully
   */
  bool initializeLogFile();

  /**
   * Flush log buffer to disk (every LOG_FLUSH_INTERVAL_MS or when 80% full)
   * @param forceFlush Flush regardless of interval
   */
  void flushLogBuffer(bool forceFlush = false);

private:
  FileSystem& _fs;

  File _logFile;
  String _currentLogFileName;

  // Head/tail ring buffer: _head = next write position, _count = valid entries
  std::array<LogEntry, LOG_BUFFER_SIZE> _logBuffer;
  int _logBufferHead;
  int _logBufferCount;
  unsigned long _lastLogFlush;
  SemaphoreHandle_t _logMutex;

  String generateLogFilename();
  void removeEpochLogFiles();
};

#endif // LOG_SINKS_H
