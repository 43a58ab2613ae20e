#include "devpulse/devices/memory_store.hpp"

#include <mutex>

namespace devpulse::devices {

common::Status MemoryDeviceStore::save(const common::Context &ctx, const Device &device) {
  if (auto status = ctx.error(); !status.ok()) {
    return status;
  }
  if (auto status = validate_device(device); !status.ok()) {
    return status;
  }
  const std::string key = normalize_identifier(device.identifier);
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (devices_.contains(key)) {
    return common::Status::validation("device already exists: " + key);
  }
  Device stored = device;
  stored.identifier = key;
  devices_.emplace(key, std::move(stored));
  return common::Status::success();
}

common::Status MemoryDeviceStore::update(const common::Context &ctx, const Device &device) {
  if (auto status = ctx.error(); !status.ok()) {
    return status;
  }
  const std::string key = normalize_identifier(device.identifier);
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto it = devices_.find(key);
  if (it == devices_.end()) {
    return common::Status::not_found("device not found: " + key);
  }
  it->second = device;
  it->second.identifier = key;
  return common::Status::success();
}

common::Result<std::optional<Device>>
MemoryDeviceStore::find_by_identifier(const common::Context &ctx, const std::string &identifier) {
  if (auto status = ctx.error(); !status.ok()) {
    return common::Result<std::optional<Device>>::failure(status);
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = devices_.find(normalize_identifier(identifier));
  if (it == devices_.end()) {
    return common::Result<std::optional<Device>>::success(std::nullopt);
  }
  return common::Result<std::optional<Device>>::success(it->second);
}

common::Result<bool> MemoryDeviceStore::exists(const common::Context &ctx,
                                               const std::string &identifier) {
  if (auto status = ctx.error(); !status.ok()) {
    return common::Result<bool>::failure(status);
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return common::Result<bool>::success(devices_.contains(normalize_identifier(identifier)));
}

common::Result<std::vector<Device>> MemoryDeviceStore::list(const common::Context &ctx,
                                                            const std::size_t offset,
                                                            const std::size_t limit) {
  if (auto status = ctx.error(); !status.ok()) {
    return common::Result<std::vector<Device>>::failure(status);
  }
  std::vector<Device> out;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::size_t index = 0;
  for (const auto &[key, device] : devices_) {
    (void)key;
    if (index++ < offset) {
      continue;
    }
    if (out.size() >= limit) {
      break;
    }
    out.push_back(device);
  }
  return common::Result<std::vector<Device>>::success(std::move(out));
}

common::Result<bool> MemoryDeviceStore::remove(const common::Context &ctx,
                                               const std::string &identifier) {
  if (auto status = ctx.error(); !status.ok()) {
    return common::Result<bool>::failure(status);
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return common::Result<bool>::success(devices_.erase(normalize_identifier(identifier)) > 0);
}

common::Result<std::size_t> MemoryDeviceStore::count(const common::Context &ctx) {
  if (auto status = ctx.error(); !status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return common::Result<std::size_t>::success(devices_.size());
}

} // namespace devpulse::devices
