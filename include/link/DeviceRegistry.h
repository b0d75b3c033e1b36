// ============================================================================
// DEVICE REGISTRY - Known haptic devices keyed by server device index
// ============================================================================
// Owned by DeviceLinkClient. Mutated only by inbound DeviceAdded /
// DeviceRemoved / DeviceList messages; everyone else reads snapshots.
// ============================================================================

#ifndef DEVICE_REGISTRY_H
#define DEVICE_REGISTRY_H

#include <map>
#include <mutex>
#include <string>
#include <vector>

struct Device {
  int id = -1;
  std::string name;
  std::string rawDescriptor;  // Original JSON object as sent by the server
};

class DeviceRegistry {
public:
  /** Insert or overwrite by id */
  void upsert(const Device& device);

  /** Bulk insert/overwrite (DeviceList); devices not listed are kept */
  void upsertAll(const std::vector<Device>& devices);

  /** @return true if a device was removed */
  bool remove(int id);

  bool contains(int id) const;
  size_t size() const;

  /** Ids in ascending order, copied under the lock */
  std::vector<int> ids() const;

  std::vector<Device> snapshot() const;

private:
  mutable std::mutex _mutex;
  std::map<int, Device> _devices;
};

#endif // DEVICE_REGISTRY_H
