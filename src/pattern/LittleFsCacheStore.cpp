// ============================================================================
// LITTLEFS CACHE STORE IMPLEMENTATION
// ============================================================================

#include "pattern/LittleFsCacheStore.h"
#include "core/Config.h"

bool LittleFsCacheStore::exists(const std::string& path) const {
  return _fs.fileExists(path);
}

bool LittleFsCacheStore::read(const std::string& path, std::string& out) const {
  return _fs.readFile(path, out, MAX_CACHE_FILE_BYTES);
}

bool LittleFsCacheStore::writeAtomic(const std::string& path, const std::string& data) {
  return _fs.writeFileAtomic(path, data);
}

bool LittleFsCacheStore::remove(const std::string& path) {
  if (!_fs.fileExists(path)) return true;
  return _fs.deleteFile(path);
}
