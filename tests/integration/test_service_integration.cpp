#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devpulse/devices/memory_store.hpp"
#include "devpulse/runtime/service.hpp"

namespace {

namespace common = devpulse::common;
namespace devices = devpulse::devices;
namespace obs = devpulse::observability;
namespace runtime = devpulse::runtime;
namespace testing = devpulse::testing;
using devpulse::tests::require;

std::string msg_frame(const std::string &subject, const std::uint64_t sid,
                      const std::string &payload) {
  return "MSG " + subject + " " + std::to_string(sid) + " " + std::to_string(payload.size()) +
         "\r\n" + payload + "\r\n";
}

std::string detection_payload(const std::string &mac, const std::string &address,
                              const std::string &event_id) {
  return "{\"mac_address\":\"" + mac + "\",\"ip_address\":\"" + address +
         "\",\"detected_at\":\"2024-05-01T08:00:00Z\",\"event_id\":\"" + event_id +
         "\",\"event_type\":\"device.detected\"}";
}

} // namespace

void register_service_integration_tests(std::vector<devpulse::tests::TestCase> &tests) {
  tests.push_back({"service_handles_detection_from_bus", [] {
                     testing::TempWorkspace workspace;
                     auto config = testing::temp_config(workspace);
                     config.bus.subject_prefix = "farm";
                     auto server = std::make_shared<testing::FakeBusServer>();
                     auto client = testing::FakeHttpClient::with_status(200);
                     testing::RecordingObserver observer;

                     runtime::Service service(config, observer,
                                              runtime::ServiceOverrides{
                                                  .store = nullptr,
                                                  .http_client = client,
                                                  .transport_factory =
                                                      testing::fake_transport_factory(server),
                                              });
                     const auto started = service.start();
                     require(started.ok(), started.error());
                     require(service.is_running(), "service should run");
                     require(service.store()->name() == "sqlite", "configured store used");
                     require(server->sent_contains("SUB farm.device.detected 1\r\n"),
                             "detected subject subscribed");
                     testing::seed_device(*service.store(), "AA:BB:CC:DD:EE:FF", "10.9.0.1");

                     server->deliver(msg_frame("farm.device.detected", 1,
                                               detection_payload("aa:bb:cc:dd:ee:ff", "10.9.0.1",
                                                                 "evt-1")));
                     require(testing::wait_until([&server]() {
                               return server->sent_contains("PUB farm.device.status_changed ");
                             }),
                             "status change should be published");
                     const auto sent = server->sent();
                     require(sent.find("\"cause_event_id\":\"evt-1\"") != std::string::npos,
                             "published event references the detection");
                     require(sent.find("\"status\":\"online\"") != std::string::npos,
                             "published status");

                     auto found = service.store()->find_by_identifier(common::Context::background(),
                                                                      "AA:BB:CC:DD:EE:FF");
                     require(found.ok() && found.value().has_value(), "device stored");
                     require(found.value()->status == devices::DeviceStatus::Online,
                             "device online in store");

                     // Second detection inside the cooldown window is suppressed.
                     server->deliver(msg_frame("farm.device.detected", 1,
                                               detection_payload("AA:BB:CC:DD:EE:FF", "10.9.0.1",
                                                                 "evt-2")));
                     require(testing::wait_until([&observer]() {
                               return observer.count<obs::CooldownSuppressedEvent>() == 1;
                             }),
                             "second detection suppressed");
                     require(client->calls() == 1, "one probe only");

                     const auto stopped = service.stop();
                     require(stopped.ok(), stopped.error());
                     require(!service.is_running(), "service stopped");
                     require(service.stop().ok(), "stop is idempotent");
                   }});

  tests.push_back({"service_reports_rejected_bus_payloads", [] {
                     auto config = testing::mock_config();
                     config.bus.subject_prefix = "farm";
                     auto server = std::make_shared<testing::FakeBusServer>();
                     testing::RecordingObserver observer;
                     runtime::Service service(
                         config, observer,
                         runtime::ServiceOverrides{
                             .store = std::make_shared<devices::MemoryDeviceStore>(),
                             .http_client = testing::FakeHttpClient::with_status(200),
                             .transport_factory = testing::fake_transport_factory(server),
                         });
                     require(service.start().ok(), "start");

                     server->deliver(
                         msg_frame("farm.device.detected", 1, "{\"event_type\":\"device.detected\"}"));
                     require(testing::wait_until([&observer]() {
                               for (const auto &error : observer.events_of<obs::ErrorEvent>()) {
                                 if (error.component == "ingest") {
                                   return true;
                                 }
                               }
                               return false;
                             }),
                             "invalid payload recorded");
                     require(service.stop().ok(), "stop");
                   }});

  tests.push_back({"service_start_fails_without_bus", [] {
                     auto config = testing::mock_config();
                     auto server = std::make_shared<testing::FakeBusServer>();
                     server->set_refuse(true);
                     testing::RecordingObserver observer;
                     runtime::Service service(
                         config, observer,
                         runtime::ServiceOverrides{
                             .store = std::make_shared<devices::MemoryDeviceStore>(),
                             .http_client = testing::FakeHttpClient::with_status(200),
                             .transport_factory = testing::fake_transport_factory(server),
                         });
                     const auto started = service.start();
                     require(!started.ok(), "start should fail");
                     require(started.is(devpulse::common::ErrorKind::Transport), "transport error");
                     require(!service.is_running(), "not running");
                   }});
}
