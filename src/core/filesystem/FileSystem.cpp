// ============================================================================
// FILESYSTEM IMPLEMENTATION
// ============================================================================

#include "core/filesystem/FileSystem.h"
#include "core/logger/Logger.h"
#include "core/Config.h"
#include <memory>

FileSystem::FileSystem()
  : _mounted(false) {}

// ============================================================================
// MOUNT
// ============================================================================

bool FileSystem::mount() {
  _mounted = LittleFS.begin(false);

  if (!_mounted) {
    Log.warn("⚠️ LittleFS mount failed, formatting...");
    if (LittleFS.format()) {
      _mounted = LittleFS.begin(false);
    }
    if (!_mounted) {
      Log.error("❌ LittleFS unusable: no settings file, log file or script cache");
      return false;
    }
  }

  Log.info("💾 LittleFS: " + std::to_string(LittleFS.totalBytes() / 1024) + " KB total, " +
           std::to_string(LittleFS.usedBytes() / 1024) + " KB used");
  return true;
}

// ============================================================================
// FILES
// ============================================================================

bool FileSystem::fileExists(const std::string& path) const {
  if (!_mounted || !LittleFS.exists(path.c_str())) return false;

  File f = LittleFS.open(path.c_str(), "r");
  if (!f) return false;
  bool isFile = !f.isDirectory();
  f.close();
  return isFile;
}

bool FileSystem::directoryExists(const std::string& path) const {
  if (!_mounted || !LittleFS.exists(path.c_str())) return false;

  File f = LittleFS.open(path.c_str(), "r");
  if (!f) return false;
  bool isDir = f.isDirectory();
  f.close();
  return isDir;
}

bool FileSystem::readFile(const std::string& path, std::string& out, size_t maxSize) const {
  if (!fileExists(path)) return false;

  File file = LittleFS.open(path.c_str(), "r");
  if (!file) return false;

  size_t size = file.size();
  if (size > maxSize) {
    Log.warn("⚠️ " + path + " too large (" + std::to_string(size) + " bytes)");
    file.close();
    return false;
  }

  std::unique_ptr<char[]> buf(new (std::nothrow) char[size]);
  if (!buf && size > 0) {
    file.close();
    return false;
  }

  size_t bytesRead = size > 0 ? file.readBytes(buf.get(), size) : 0;
  file.close();
  if (bytesRead != size) return false;

  out.assign(buf.get(), size);
  return true;
}

bool FileSystem::writeFile(const std::string& path, const std::string& data) {
  File file = LittleFS.open(path.c_str(), "w");
  if (!file) {
    Log.error("❌ Cannot open " + path + " for writing");
    return false;
  }

  size_t written = file.write(reinterpret_cast<const uint8_t*>(data.data()), data.size());
  file.flush();
  file.close();

  if (written != data.size()) {
    Log.warn("⚠️ Short write to " + path + ": " + std::to_string(written) + "/" +
             std::to_string(data.size()) + " bytes");
    return false;
  }
  return true;
}

bool FileSystem::writeFileAtomic(const std::string& path, const std::string& data) {
  if (!_mounted) return false;

  const std::string tmpPath = path + CACHE_TMP_SUFFIX;
  if (!writeFile(tmpPath, data)) {
    LittleFS.remove(tmpPath.c_str());
    return false;
  }

  // LittleFS rename does not replace an existing file
  if (fileExists(path) && !LittleFS.remove(path.c_str())) {
    Log.error("❌ Cannot replace " + path);
    LittleFS.remove(tmpPath.c_str());
    return false;
  }
  if (!LittleFS.rename(tmpPath.c_str(), path.c_str())) {
    Log.error("❌ Rename failed: " + tmpPath + " -> " + path);
    LittleFS.remove(tmpPath.c_str());
    return false;
  }
  return true;
}

bool FileSystem::deleteFile(const std::string& path) {
  if (!fileExists(path)) return false;
  return LittleFS.remove(path.c_str());
}

// ============================================================================
// DIRECTORIES
// ============================================================================

bool FileSystem::createDirectory(const std::string& path) {
  if (!_mounted) return false;
  if (directoryExists(path)) return true;
  return LittleFS.mkdir(path.c_str());
}
