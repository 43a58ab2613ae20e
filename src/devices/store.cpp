#include "devpulse/devices/store.hpp"

#include "devpulse/common/fs.hpp"
#include "devpulse/devices/memory_store.hpp"
#include "devpulse/devices/sqlite_store.hpp"

namespace devpulse::devices {

common::Result<std::unique_ptr<IDeviceStore>>
create_device_store(const config::StorageConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend == "memory") {
    return common::Result<std::unique_ptr<IDeviceStore>>::success(
        std::make_unique<MemoryDeviceStore>());
  }
  if (backend == "sqlite") {
    auto opened = SqliteDeviceStore::open(common::expand_path(config.path));
    if (!opened.ok()) {
      return common::Result<std::unique_ptr<IDeviceStore>>::failure(opened.status());
    }
    return common::Result<std::unique_ptr<IDeviceStore>>::success(std::move(opened.value()));
  }
  return common::Result<std::unique_ptr<IDeviceStore>>::failure(
      "unknown storage backend: " + config.backend, common::ErrorKind::Validation);
}

} // namespace devpulse::devices
