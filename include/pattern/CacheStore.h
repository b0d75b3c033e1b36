// ============================================================================
// CACHE STORE - File storage abstraction used by PatternCache
// ============================================================================
// writeAtomic() must never leave a partially written file at `path`:
// readers see the previous content, nothing, or the complete new content.
// Firmware implementation: LittleFsCacheStore (FileSystem tmp + rename).
// ============================================================================

#ifndef CACHE_STORE_H
#define CACHE_STORE_H

#include <string>

class CacheStore {
public:
  virtual ~CacheStore() = default;

  virtual bool exists(const std::string& path) const = 0;
  virtual bool read(const std::string& path, std::string& out) const = 0;
  virtual bool writeAtomic(const std::string& path, const std::string& data) = 0;

  /** @return true if the file is gone afterwards */
  virtual bool remove(const std::string& path) = 0;
};

#endif // CACHE_STORE_H
