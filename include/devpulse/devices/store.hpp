#pragma once

#include "devpulse/common/context.hpp"
#include "devpulse/common/result.hpp"
#include "devpulse/config/schema.hpp"
#include "devpulse/devices/device.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace devpulse::devices {

/// Persistent device records keyed by normalized identifier. Implementations are
/// internally synchronized.
class IDeviceStore {
public:
  virtual ~IDeviceStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  /// Fails with a Validation error if the identifier is already stored.
  [[nodiscard]] virtual common::Status save(const common::Context &ctx, const Device &device) = 0;
  /// Fails with a NotFound error if the identifier is not stored.
  [[nodiscard]] virtual common::Status update(const common::Context &ctx,
                                              const Device &device) = 0;
  /// An empty optional means no such device.
  [[nodiscard]] virtual common::Result<std::optional<Device>>
  find_by_identifier(const common::Context &ctx, const std::string &identifier) = 0;
  [[nodiscard]] virtual common::Result<bool> exists(const common::Context &ctx,
                                                    const std::string &identifier) = 0;
  /// Devices ordered by identifier.
  [[nodiscard]] virtual common::Result<std::vector<Device>>
  list(const common::Context &ctx, std::size_t offset, std::size_t limit) = 0;
  [[nodiscard]] virtual common::Result<bool> remove(const common::Context &ctx,
                                                    const std::string &identifier) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count(const common::Context &ctx) = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<IDeviceStore>>
create_device_store(const config::StorageConfig &config);

} // namespace devpulse::devices
