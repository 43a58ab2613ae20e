#include "devpulse/devices/sqlite_store.hpp"

#include "devpulse/common/time_util.hpp"

#include <limits>

namespace devpulse::devices {

namespace {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg);
  }
  return common::Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, index));
  return text == nullptr ? std::string() : std::string(text);
}

void bind_device(sqlite3_stmt *stmt, const Device &device, const std::string &key) {
  const std::string registered_at = common::format_rfc3339(device.registered_at);
  const std::string last_seen = common::format_rfc3339(device.last_seen);
  const std::string status = status_to_string(device.status);
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, device.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, device.address.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, device.location.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 5, registered_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 6, last_seen.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, status.c_str(), -1, SQLITE_TRANSIENT);
}

constexpr const char *kSelectColumns =
    "SELECT identifier, name, address, location, registered_at, last_seen, status FROM devices";

} // namespace

common::Result<std::unique_ptr<SqliteDeviceStore>>
SqliteDeviceStore::open(const std::filesystem::path &db_path) {
  std::error_code ec;
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return common::Result<std::unique_ptr<SqliteDeviceStore>>::failure(
          "failed to create database directory: " + ec.message());
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string msg = db == nullptr ? "sqlite open failed" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return common::Result<std::unique_ptr<SqliteDeviceStore>>::failure(
        "failed to open " + db_path.string() + ": " + msg);
  }

  std::unique_ptr<SqliteDeviceStore> store(new SqliteDeviceStore(db_path, db));
  if (auto status = store->init_schema(); !status.ok()) {
    return common::Result<std::unique_ptr<SqliteDeviceStore>>::failure(status);
  }
  return common::Result<std::unique_ptr<SqliteDeviceStore>>::success(std::move(store));
}

SqliteDeviceStore::SqliteDeviceStore(std::filesystem::path db_path, sqlite3 *db)
    : db_path_(std::move(db_path)), db_(db) {}

SqliteDeviceStore::~SqliteDeviceStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteDeviceStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS devices (
  identifier TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  address TEXT NOT NULL,
  location TEXT NOT NULL DEFAULT '',
  registered_at TEXT NOT NULL,
  last_seen TEXT NOT NULL,
  status TEXT NOT NULL DEFAULT 'registered'
);
)");
}

common::Result<Device> SqliteDeviceStore::row_to_device(sqlite3_stmt *stmt) const {
  Device device;
  device.identifier = column_text(stmt, 0);
  device.name = column_text(stmt, 1);
  device.address = column_text(stmt, 2);
  device.location = column_text(stmt, 3);

  auto registered = common::parse_rfc3339(column_text(stmt, 4));
  if (!registered.ok()) {
    return common::Result<Device>::failure("corrupt registered_at for " + device.identifier +
                                           ": " + registered.error());
  }
  device.registered_at = registered.value();

  auto last_seen = common::parse_rfc3339(column_text(stmt, 5));
  if (!last_seen.ok()) {
    return common::Result<Device>::failure("corrupt last_seen for " + device.identifier + ": " +
                                           last_seen.error());
  }
  device.last_seen = last_seen.value();

  const auto status = status_from_string(column_text(stmt, 6));
  device.status = status.value_or(DeviceStatus::Unknown);
  return common::Result<Device>::success(std::move(device));
}

common::Status SqliteDeviceStore::save(const common::Context &ctx, const Device &device) {
  if (auto status = ctx.error(); !status.ok()) {
    return status;
  }
  if (auto status = validate_device(device); !status.ok()) {
    return status;
  }
  const std::string key = normalize_identifier(device.identifier);

  std::lock_guard<std::mutex> lock(mutex_);
  static constexpr const char *sql =
      "INSERT INTO devices (identifier, name, address, location, registered_at, last_seen, "
      "status) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind_device(stmt, device, key);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_CONSTRAINT) {
    return common::Status::validation("device already exists: " + key);
  }
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return common::Status::success();
}

common::Status SqliteDeviceStore::update(const common::Context &ctx, const Device &device) {
  if (auto status = ctx.error(); !status.ok()) {
    return status;
  }
  const std::string key = normalize_identifier(device.identifier);

  std::lock_guard<std::mutex> lock(mutex_);
  static constexpr const char *sql =
      "UPDATE devices SET name = ?2, address = ?3, location = ?4, registered_at = ?5, "
      "last_seen = ?6, status = ?7 WHERE identifier = ?1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  bind_device(stmt, device, key);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::not_found("device not found: " + key);
  }
  return common::Status::success();
}

common::Result<std::optional<Device>>
SqliteDeviceStore::find_by_identifier(const common::Context &ctx, const std::string &identifier) {
  using R = common::Result<std::optional<Device>>;
  if (auto status = ctx.error(); !status.ok()) {
    return R::failure(status);
  }
  const std::string key = normalize_identifier(identifier);

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sql = std::string(kSelectColumns) + " WHERE identifier = ?1";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(stmt);
    return R::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(stmt);
    return R::failure(sqlite3_errmsg(db_));
  }
  auto device = row_to_device(stmt);
  sqlite3_finalize(stmt);
  if (!device.ok()) {
    return R::failure(device.status());
  }
  return R::success(std::move(device.value()));
}

common::Result<bool> SqliteDeviceStore::exists(const common::Context &ctx,
                                               const std::string &identifier) {
  auto found = find_by_identifier(ctx, identifier);
  if (!found.ok()) {
    return common::Result<bool>::failure(found.status());
  }
  return common::Result<bool>::success(found.value().has_value());
}

common::Result<std::vector<Device>> SqliteDeviceStore::list(const common::Context &ctx,
                                                            const std::size_t offset,
                                                            const std::size_t limit) {
  using R = common::Result<std::vector<Device>>;
  if (auto status = ctx.error(); !status.ok()) {
    return R::failure(status);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const std::string sql =
      std::string(kSelectColumns) + " ORDER BY identifier ASC LIMIT ?1 OFFSET ?2";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite3_errmsg(db_));
  }
  const auto max_rows = static_cast<std::size_t>(std::numeric_limits<sqlite3_int64>::max());
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit > max_rows ? max_rows : limit));
  sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(offset > max_rows ? max_rows : offset));

  std::vector<Device> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto device = row_to_device(stmt);
    if (!device.ok()) {
      sqlite3_finalize(stmt);
      return R::failure(device.status());
    }
    out.push_back(std::move(device.value()));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite3_errmsg(db_));
  }
  return R::success(std::move(out));
}

common::Result<bool> SqliteDeviceStore::remove(const common::Context &ctx,
                                               const std::string &identifier) {
  if (auto status = ctx.error(); !status.ok()) {
    return common::Result<bool>::failure(status);
  }
  const std::string key = normalize_identifier(identifier);

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM devices WHERE identifier = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<bool>::failure(sqlite3_errmsg(db_));
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

common::Result<std::size_t> SqliteDeviceStore::count(const common::Context &ctx) {
  if (auto status = ctx.error(); !status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM devices", -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

} // namespace devpulse::devices
