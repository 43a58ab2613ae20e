#pragma once

#include "devpulse/devices/store.hpp"

#include <map>
#include <shared_mutex>

namespace devpulse::devices {

class MemoryDeviceStore final : public IDeviceStore {
public:
  [[nodiscard]] std::string_view name() const override { return "memory"; }
  [[nodiscard]] common::Status save(const common::Context &ctx, const Device &device) override;
  [[nodiscard]] common::Status update(const common::Context &ctx, const Device &device) override;
  [[nodiscard]] common::Result<std::optional<Device>>
  find_by_identifier(const common::Context &ctx, const std::string &identifier) override;
  [[nodiscard]] common::Result<bool> exists(const common::Context &ctx,
                                            const std::string &identifier) override;
  [[nodiscard]] common::Result<std::vector<Device>>
  list(const common::Context &ctx, std::size_t offset, std::size_t limit) override;
  [[nodiscard]] common::Result<bool> remove(const common::Context &ctx,
                                            const std::string &identifier) override;
  [[nodiscard]] common::Result<std::size_t> count(const common::Context &ctx) override;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, Device> devices_;
};

} // namespace devpulse::devices
