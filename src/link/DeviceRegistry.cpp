// ============================================================================
// DEVICE REGISTRY IMPLEMENTATION
// ============================================================================

#include "link/DeviceRegistry.h"

void DeviceRegistry::upsert(const Device& device) {
  std::lock_guard<std::mutex> lock(_mutex);
  _devices[device.id] = device;
}

void DeviceRegistry::upsertAll(const std::vector<Device>& devices) {
  std::lock_guard<std::mutex> lock(_mutex);
  for (const auto& device : devices) {
    _devices[device.id] = device;
  }
}

bool DeviceRegistry::remove(int id) {
  std::lock_guard<std::mutex> lock(_mutex);
  return _devices.erase(id) > 0;
}

bool DeviceRegistry::contains(int id) const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _devices.count(id) > 0;
}

size_t DeviceRegistry::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _devices.size();
}

std::vector<int> DeviceRegistry::ids() const {
  std::lock_guard<std::mutex> lock(_mutex);
  std::vector<int> out;
  out.reserve(_devices.size());
  for (const auto& [id, device] : _devices) {
    out.push_back(id);
  }
  return out;
}

std::vector<Device> DeviceRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(_mutex);
  std::vector<Device> out;
  out.reserve(_devices.size());
  for (const auto& [id, device] : _devices) {
    out.push_back(device);
  }
  return out;
}
