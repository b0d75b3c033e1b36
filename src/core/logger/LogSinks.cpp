// ============================================================================
// LOG SINKS IMPLEMENTATION
// ============================================================================

#include "core/logger/LogSinks.h"
#include "core/filesystem/FileSystem.h"
#include "core/TimeUtils.h"
#include <ArduinoJson.h>

// ============================================================================
// SERIAL
// ============================================================================

void SerialLogSink::write(LogLevel level, const char* prefix, const std::string& message) {
  (void)level;
  Serial.print(prefix);
  Serial.println(message.c_str());
}

// ============================================================================
// WEBSOCKET BROADCAST
// ============================================================================

void WebSocketLogSink::write(LogLevel level, const char* prefix, const std::string& message) {
  (void)prefix;
  if (level > LogLevel::LOG_WARNING) return;

  JsonDocument doc;
  doc["type"] = "log";
  doc["level"] = Logger::getLevelName(level);
  doc["message"] = message;

  std::string payload;
  serializeJson(doc, payload);
  _pending.push(std::move(payload));
}

void WebSocketLogSink::drain() {
  std::vector<std::string> lines = _pending.takeAll();
  if (lines.empty() || _ws.connectedClients() == 0) return;

  for (const std::string& line : lines) {
    _ws.broadcastTXT(line.c_str(), line.size());
  }
}

// ============================================================================
// BUFFERED FILE
// ============================================================================

FileLogSink::FileLogSink(FileSystem& fs)
  : _fs(fs),
    _logBufferHead(0),
    _logBufferCount(0),
    _lastLogFlush(0),
    _logMutex(nullptr) {
  _logMutex = xSemaphoreCreateMutex();
}

void FileLogSink::write(LogLevel level, const char* prefix, const std::string& message) {
  (void)level;
  if (!_fs.isReady()) return;

  // Initialize log file if not yet open (delayed for NTP sync)
  if (!_logFile && TimeUtils::isSynchronized()) {
    initializeLogFile();
  }

  if (_logFile && _logMutex && xSemaphoreTake(_logMutex, pdMS_TO_TICKS(10)) == pdTRUE) {
    _logBuffer[_logBufferHead].timestamp = millis();
    _logBuffer[_logBufferHead].line = std::string(prefix) + message;

    _logBufferHead = (_logBufferHead + 1) % LOG_BUFFER_SIZE;
    if (_logBufferCount < LOG_BUFFER_SIZE) _logBufferCount++;
    xSemaphoreGive(_logMutex);
  }
}

bool FileLogSink::initializeLogFile() {
  if (!_fs.isReady()) return false;

  if (!TimeUtils::isSynchronized()) {
    Serial.println("[Logger] ⏳ NTP not synced yet - cannot create log file");
    return false;
  }

  if (!_fs.directoryExists(LOG_DIR)) {
    Serial.println("[Logger] 📁 Creating /logs directory...");
    _fs.createDirectory(LOG_DIR);
  }

  removeEpochLogFiles();

  _currentLogFileName = generateLogFilename();

  // Direct LittleFS: append mode is not exposed by the FileSystem wrapper
  _logFile = LittleFS.open(_currentLogFileName, "a");
  if (!_logFile) {
    Serial.println("[Logger] ❌ Failed to open log file: " + _currentLogFileName);
    return false;
  }

  Serial.println("[Logger] ✅ Log file opened: " + _currentLogFileName);

  auto ts = TimeUtils::format("%Y-%m-%d %H:%M:%S");

  _logFile.println("");
  _logFile.println("========================================");
  _logFile.print("SESSION START: ");
  _logFile.println(ts.c_str());
  _logFile.println("========================================");
  _logFile.flush();

  return true;
}

void FileLogSink::flushLogBuffer(bool forceFlush) {
  if (!_logFile || !_fs.isReady() || !_logMutex) return;

  unsigned long now = millis();

  if (xSemaphoreTake(_logMutex, pdMS_TO_TICKS(50)) != pdTRUE) return;

  int validEntries = _logBufferCount;
  float bufferUsagePercent = (static_cast<float>(validEntries) * 100.0f) / LOG_BUFFER_SIZE;
  bool shouldForce = (bufferUsagePercent >= LOG_FORCE_FLUSH_PERCENT);

  if (!forceFlush && !shouldForce && now - _lastLogFlush < LOG_FLUSH_INTERVAL_MS) {
    xSemaphoreGive(_logMutex);
    return;
  }

  if (validEntries == 0) {
    _lastLogFlush = now;
    xSemaphoreGive(_logMutex);
    return;
  }

  // Oldest entry is at (_logBufferHead - _logBufferCount + LOG_BUFFER_SIZE) % LOG_BUFFER_SIZE
  int tail = (_logBufferHead - _logBufferCount + LOG_BUFFER_SIZE) % LOG_BUFFER_SIZE;
  std::array<LogEntry, LOG_BUFFER_SIZE> localBuffer;
  for (int i = 0; i < validEntries; i++) {
    int idx = (tail + i) % LOG_BUFFER_SIZE;
    localBuffer[i].timestamp = _logBuffer[idx].timestamp;
    localBuffer[i].line.swap(_logBuffer[idx].line);
  }
  _logBufferCount = 0;
  xSemaphoreGive(_logMutex);

  time_t currentTime = TimeUtils::epochSeconds();
  bool timeValid = TimeUtils::isSynchronized();

  for (int i = 0; i < validEntries; i++) {
    if (timeValid) {
      time_t logTime = currentTime - ((now - localBuffer[i].timestamp) / 1000);
      auto tsStr = TimeUtils::format("%Y-%m-%d %H:%M:%S", logTime);
      _logFile.print("[");
      _logFile.print(tsStr.c_str());
      _logFile.print("] ");
    } else {
      _logFile.print("[T+");
      _logFile.print(localBuffer[i].timestamp / 1000);
      _logFile.print("s] ");
    }
    _logFile.println(localBuffer[i].line.c_str());
  }

  _logFile.flush();
  if (!_logFile) {
    Serial.println("[Logger] ⚠️ Log file corrupted during flush - reinitializing...");
    initializeLogFile();
  }

  _lastLogFlush = now;
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

String FileLogSink::generateLogFilename() {
  auto dateStr = String(TimeUtils::format("%Y%m%d").c_str());

  // Find max suffix by scanning /logs directory
  int maxSuffix = -1;

  if (auto scanDir = LittleFS.open(LOG_DIR); scanDir) {
    const String prefix = "log_" + dateStr + "_";
    for (File file = scanDir.openNextFile(); file; file = scanDir.openNextFile()) {
      auto fileName = String(file.name());
      if (!fileName.startsWith(prefix) || !fileName.endsWith(LOG_FILE_EXTENSION)) continue;
      String suffixStr = fileName.substring(prefix.length(), fileName.length() - 4);
      int suffix = suffixStr.toInt();
      if (suffix > maxSuffix) maxSuffix = suffix;
    }
    scanDir.close();
  }

  return String(LOG_FILE_PATTERN) + dateStr + "_" + String(maxSuffix + 1) + LOG_FILE_EXTENSION;
}

void FileLogSink::removeEpochLogFiles() {
  // Files created before NTP sync carry a 1970 date
  File logsDir = LittleFS.open(LOG_DIR);
  if (!logsDir || !logsDir.isDirectory()) return;

  for (File logFile = logsDir.openNextFile(); logFile; logFile = logsDir.openNextFile()) {
    auto fileName = String(logFile.name());
    if (fileName.indexOf("1970") < 0) continue;
    String fullPath = String(LOG_DIR) + "/" + fileName;
    logFile.close();
    if (LittleFS.remove(fullPath)) {
      Serial.println("[Logger] 🗑️ Removed epoch file: " + fullPath);
    }
  }
}
