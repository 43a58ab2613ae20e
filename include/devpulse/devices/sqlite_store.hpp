#pragma once

#include "devpulse/devices/store.hpp"

#include <filesystem>
#include <mutex>
#include <sqlite3.h>

namespace devpulse::devices {

class SqliteDeviceStore final : public IDeviceStore {
public:
  /// Opens (creating if needed) the database and its schema.
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteDeviceStore>>
  open(const std::filesystem::path &db_path);
  ~SqliteDeviceStore() override;

  SqliteDeviceStore(const SqliteDeviceStore &) = delete;
  SqliteDeviceStore &operator=(const SqliteDeviceStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
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

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  SqliteDeviceStore(std::filesystem::path db_path, sqlite3 *db);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<Device> row_to_device(sqlite3_stmt *stmt) const;

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

} // namespace devpulse::devices
