// ============================================================================
// LITTLEFS CACHE STORE - CacheStore over FileSystem (firmware)
// ============================================================================

#ifndef LITTLEFS_CACHE_STORE_H
#define LITTLEFS_CACHE_STORE_H

#include "core/filesystem/FileSystem.h"
#include "pattern/CacheStore.h"

class LittleFsCacheStore : public CacheStore {
public:
  explicit LittleFsCacheStore(FileSystem& fs) : _fs(fs) {}

  bool exists(const std::string& path) const override;
  bool read(const std::string& path, std::string& out) const override;
  bool writeAtomic(const std::string& path, const std::string& data) override;
  bool remove(const std::string& path) override;

private:
  FileSystem& _fs;
};

#endif // LITTLEFS_CACHE_STORE_H
