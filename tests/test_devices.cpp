#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devpulse/devices/device.hpp"
#include "devpulse/devices/memory_store.hpp"
#include "devpulse/devices/sqlite_store.hpp"
#include "devpulse/devices/store.hpp"

#include <functional>
#include <memory>

namespace {

namespace common = devpulse::common;
namespace devices = devpulse::devices;
using devpulse::tests::require;

devices::Device sample(const std::string &identifier, const std::string &address = "10.0.0.5") {
  auto made = devices::make_device(identifier, "Soil sensor", address, "Greenhouse 2");
  require(made.ok(), made.error());
  return made.value();
}

// The same behaviour is expected of every backend.
void exercise_store(devices::IDeviceStore &store) {
  const auto ctx = common::Context::background();

  auto saved = store.save(ctx, sample("aa:bb:cc:dd:ee:ff"));
  require(saved.ok(), saved.error());

  auto duplicate = store.save(ctx, sample("AA:BB:CC:DD:EE:FF"));
  require(!duplicate.ok(), "duplicate identifier should fail");
  require(duplicate.kind() == common::ErrorKind::Validation, "duplicate is a validation error");

  auto found = store.find_by_identifier(ctx, " aa:bb:cc:dd:ee:ff ");
  require(found.ok(), found.error());
  require(found.value().has_value(), "device should be found by unnormalized key");
  require(found.value()->identifier == "AA:BB:CC:DD:EE:FF", "identifier should be normalized");
  require(found.value()->status == devices::DeviceStatus::Registered,
          "new device should be registered");
  require(found.value()->location == "Greenhouse 2", "location should persist");

  auto device = *found.value();
  device.update_status(devices::DeviceStatus::Online);
  auto updated = store.update(ctx, device);
  require(updated.ok(), updated.error());
  auto reloaded = store.find_by_identifier(ctx, "AA:BB:CC:DD:EE:FF");
  require(reloaded.ok() && reloaded.value().has_value(), "device should reload");
  require(reloaded.value()->status == devices::DeviceStatus::Online, "status should update");

  auto missing_update = store.update(ctx, sample("11:22:33:44:55:66"));
  require(!missing_update.ok(), "update of unknown device should fail");
  require(missing_update.kind() == common::ErrorKind::NotFound, "update miss is not-found");

  auto missing = store.find_by_identifier(ctx, "11:22:33:44:55:66");
  require(missing.ok(), missing.error());
  require(!missing.value().has_value(), "unknown device should be empty");

  require(store.save(ctx, sample("00:00:00:00:00:02")).ok(), "second save");
  require(store.save(ctx, sample("00:00:00:00:00:01")).ok(), "third save");

  auto count = store.count(ctx);
  require(count.ok() && count.value() == 3, "count should be 3");

  auto listed = store.list(ctx, 0, 10);
  require(listed.ok(), listed.error());
  require(listed.value().size() == 3, "list should return all devices");
  require(listed.value()[0].identifier == "00:00:00:00:00:01", "list should be ordered");
  require(listed.value()[2].identifier == "AA:BB:CC:DD:EE:FF", "list should be ordered");

  auto page = store.list(ctx, 1, 1);
  require(page.ok() && page.value().size() == 1, "page size should be 1");
  require(page.value()[0].identifier == "00:00:00:00:00:02", "page offset mismatch");

  auto exists = store.exists(ctx, "00:00:00:00:00:02");
  require(exists.ok() && exists.value(), "device should exist");

  auto removed = store.remove(ctx, "00:00:00:00:00:02");
  require(removed.ok() && removed.value(), "remove should report true");
  auto removed_again = store.remove(ctx, "00:00:00:00:00:02");
  require(removed_again.ok() && !removed_again.value(), "second remove should report false");

  const auto cancelled = common::Context::with_cancel(common::Context::background());
  cancelled.cancel();
  auto refused = store.find_by_identifier(cancelled, "AA:BB:CC:DD:EE:FF");
  require(!refused.ok(), "cancelled context should be refused");
  require(refused.kind() == common::ErrorKind::Cancelled, "refusal should be cancellation");
}

} // namespace

void register_devices_tests(std::vector<devpulse::tests::TestCase> &tests) {
  namespace testing = devpulse::testing;

  tests.push_back({"device_identifier_validation", [] {
                     require(devices::validate_identifier("AA:BB:CC:DD:EE:FF").ok(), "colon form");
                     require(devices::validate_identifier("aa-bb-cc-dd-ee-ff").ok(), "dash form");
                     require(!devices::validate_identifier("").ok(), "empty identifier");
                     require(!devices::validate_identifier("AA:BB:CC:DD:EE").ok(), "too short");
                     require(!devices::validate_identifier("AA:BB-CC:DD:EE:FF").ok(),
                             "mixed separators");
                     require(!devices::validate_identifier("GG:BB:CC:DD:EE:FF").ok(),
                             "non-hex digit");
                   }});

  tests.push_back({"device_address_validation", [] {
                     require(devices::validate_address("192.168.1.20").ok(), "ipv4");
                     require(devices::validate_address("192.168.1.20:8080").ok(), "ipv4 with port");
                     require(devices::validate_address("fe80::1").ok(), "bare ipv6");
                     require(devices::validate_address("[fe80::1]").ok(), "bracketed ipv6");
                     require(devices::validate_address("[fe80::1]:80").ok(), "bracketed ipv6 with port");
                     require(!devices::validate_address("999.1.1.1").ok(), "octet out of range");
                     require(!devices::validate_address("10.0.0").ok(), "too few octets");
                     require(!devices::validate_address("a..b").ok(), "not an address");
                     require(!devices::validate_address("---").ok(), "dashes only");
                     require(!devices::validate_address("sensor-3.local:8080").ok(),
                             "host names are rejected");
                     require(!devices::validate_address("10.0.0.1:0").ok(), "port zero");
                     require(!devices::validate_address("10.0.0.1:70000").ok(), "port too large");
                     require(!devices::validate_address("10.0.0.1:").ok(), "empty port");
                     require(!devices::validate_address("[fe80::1").ok(), "unterminated bracket");
                     require(!devices::validate_address("[10.0.0.1]:80").ok(),
                             "brackets only hold ipv6");
                     require(!devices::validate_address("").ok(), "empty address");
                     require(!devices::validate_address("10.0.0.1/admin").ok(), "path rejected");
                     require(!devices::validate_address("a b").ok(), "space rejected");
                   }});

  tests.push_back({"make_device_normalizes_and_validates", [] {
                     auto device = devices::make_device(" aa:bb:cc:dd:ee:ff ", " Pump ",
                                                        " 10.1.1.1 ", "");
                     require(device.ok(), device.error());
                     require(device.value().identifier == "AA:BB:CC:DD:EE:FF", "normalized id");
                     require(device.value().name == "Pump", "trimmed name");
                     require(device.value().address == "10.1.1.1", "trimmed address");
                     require(device.value().status == devices::DeviceStatus::Registered,
                             "registered status");

                     require(!devices::make_device("AA:BB:CC:DD:EE:FF", " ", "10.1.1.1", "").ok(),
                             "blank name should fail");
                     require(!devices::make_device("AA:BB:CC:DD:EE:FF", std::string(101, 'n'),
                                                   "10.1.1.1", "")
                                  .ok(),
                             "long name should fail");
                   }});

  tests.push_back({"device_status_strings", [] {
                     require(devices::status_to_string(devices::DeviceStatus::Online) == "online",
                             "online string");
                     require(devices::status_from_string(" OFFLINE ") ==
                                 devices::DeviceStatus::Offline,
                             "case-insensitive parse");
                     require(!devices::status_from_string("sleeping").has_value(),
                             "unknown status string");
                   }});

  tests.push_back({"update_status_refreshes_last_seen", [] {
                     auto device = sample("AA:BB:CC:DD:EE:01");
                     const auto later = device.last_seen + std::chrono::seconds(30);
                     device.update_status(devices::DeviceStatus::Offline, later);
                     require(device.status == devices::DeviceStatus::Offline, "status set");
                     require(device.last_seen == later, "last_seen set");
                   }});

  tests.push_back({"memory_store_contract", [] {
                     devices::MemoryDeviceStore store;
                     exercise_store(store);
                   }});

  tests.push_back({"sqlite_store_contract", [] {
                     testing::TempWorkspace workspace;
                     auto store = devices::SqliteDeviceStore::open(workspace.path() / "db" /
                                                                   "devices.db");
                     require(store.ok(), store.error());
                     exercise_store(*store.value());
                   }});

  tests.push_back({"sqlite_store_persists_across_reopen", [] {
                     testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "devices.db";
                     {
                       auto store = devices::SqliteDeviceStore::open(path);
                       require(store.ok(), store.error());
                       auto device = sample("AA:BB:CC:DD:EE:FF");
                       device.update_status(devices::DeviceStatus::Offline);
                       require(store.value()->save(common::Context::background(), device).ok(),
                               "save should succeed");
                     }
                     auto reopened = devices::SqliteDeviceStore::open(path);
                     require(reopened.ok(), reopened.error());
                     auto found = reopened.value()->find_by_identifier(
                         common::Context::background(), "AA:BB:CC:DD:EE:FF");
                     require(found.ok() && found.value().has_value(), "device should persist");
                     require(found.value()->status == devices::DeviceStatus::Offline,
                             "status should persist");
                     require(found.value()->name == "Soil sensor", "name should persist");
                   }});

  tests.push_back({"create_device_store_selects_backend", [] {
                     testing::TempWorkspace workspace;
                     devpulse::config::StorageConfig config;
                     config.backend = "memory";
                     auto memory = devices::create_device_store(config);
                     require(memory.ok(), memory.error());
                     require(memory.value()->name() == "memory", "memory backend");

                     config.backend = "SQLite";
                     config.path = (workspace.path() / "x.db").string();
                     auto sqlite = devices::create_device_store(config);
                     require(sqlite.ok(), sqlite.error());
                     require(sqlite.value()->name() == "sqlite", "sqlite backend");

                     config.backend = "postgres";
                     auto unknown = devices::create_device_store(config);
                     require(!unknown.ok(), "unknown backend should fail");
                     require(unknown.kind() == common::ErrorKind::Validation,
                             "unknown backend is a validation error");
                   }});
}
