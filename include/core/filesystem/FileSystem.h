// ============================================================================
// FILESYSTEM - LittleFS Wrapper (settings, log files, script cache)
// ============================================================================
// Thin layer over LittleFS used by the firmware only:
// - mount with format fallback (degraded mode when the flash is unusable)
// - whole-file read with a size cap
// - atomic replace through "<path>.tmp" + rename
// - directory creation for /logs and the cache directory
// ============================================================================

#ifndef FILESYSTEM_H
#define FILESYSTEM_H

#include <Arduino.h>
#include <LittleFS.h>
#include <string>

class FileSystem {
public:
  FileSystem();

  /**
   * Mount LittleFS (mount → format → remount)
   * @return false when running without flash storage
   */
  bool mount();

  bool isReady() const { return _mounted; }

  bool fileExists(const std::string& path) const;
  bool directoryExists(const std::string& path) const;

  /**
   * Read a whole file
   * @param maxSize Files larger than this are rejected
   */
  bool readFile(const std::string& path, std::string& out, size_t maxSize) const;

  /** Write "<path>.tmp", then rename it over path */
  bool writeFileAtomic(const std::string& path, const std::string& data);

  bool deleteFile(const std::string& path);

  /** No-op when the directory already exists */
  bool createDirectory(const std::string& path);

private:
  bool _mounted;

  bool writeFile(const std::string& path, const std::string& data);
};

#endif // FILESYSTEM_H
