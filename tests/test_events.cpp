#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devpulse/common/json_util.hpp"
#include "devpulse/devices/memory_store.hpp"
#include "devpulse/events/detection.hpp"
#include "devpulse/events/subjects.hpp"
#include "devpulse/health/orchestrator.hpp"
#include "devpulse/ingest/detection_handler.hpp"

#include <regex>
#include <set>

namespace {

namespace common = devpulse::common;
namespace devices = devpulse::devices;
namespace events = devpulse::events;
namespace health = devpulse::health;
namespace obs = devpulse::observability;
namespace testing = devpulse::testing;
using devpulse::tests::require;
using namespace std::chrono_literals;

const char *kValidPayload = R"({
  "mac_address": "aa:bb:cc:dd:ee:ff",
  "ip_address": "192.168.1.40",
  "detected_at": "2024-05-01T08:00:00Z",
  "event_id": "2f1c7f0e-4a44-4a3e-9d7e-1b2f3c4d5e6f",
  "event_type": "device.detected"
})";

struct HandlerFixture {
  std::shared_ptr<devices::MemoryDeviceStore> store = std::make_shared<devices::MemoryDeviceStore>();
  std::shared_ptr<testing::FakeHttpClient> client = testing::FakeHttpClient::with_status(200);
  testing::RecordingObserver observer;
  health::HealthCheckOrchestrator orchestrator;
  devpulse::ingest::DetectionHandler handler;

  HandlerFixture()
      : orchestrator(store,
                     std::make_shared<health::RetryingHealthProbe>(
                         health::HealthProbe(client, {}),
                         health::RetryPolicy{.attempts = 1, .initial_delay = 1ms}, observer),
                     health::OrchestratorOptions{}, observer),
        handler(events::detected_subject("farm"), orchestrator, observer) {}
};

} // namespace

void register_events_tests(std::vector<devpulse::tests::TestCase> &tests) {
  tests.push_back({"parse_detection_event_reads_wire_fields", [] {
                     const auto parsed = events::parse_detection_event(kValidPayload);
                     require(parsed.ok(), parsed.error());
                     const auto &event = parsed.value();
                     require(event.identifier == "AA:BB:CC:DD:EE:FF", "mac should be normalized");
                     require(event.address == "192.168.1.40", "address mismatch");
                     require(event.event_type == events::kDeviceDetectedType, "type mismatch");
                     require(common::format_rfc3339(event.detected_at) == "2024-05-01T08:00:00Z",
                             "detected_at mismatch");
                   }});

  tests.push_back({"parse_detection_event_defaults_missing_timestamp", [] {
                     const auto before = std::chrono::system_clock::now() - 1s;
                     const auto parsed = events::parse_detection_event(
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","ip_address":"10.0.0.1",)"
                         R"("event_id":"e-1","event_type":"device.detected"})");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().detected_at >= before, "timestamp should default to now");
                   }});

  tests.push_back({"parse_detection_event_reports_missing_fields", [] {
                     const auto no_mac = events::parse_detection_event(
                         R"({"ip_address":"10.0.0.1","event_id":"e","event_type":"device.detected"})");
                     require(!no_mac.ok() && no_mac.error() == "mac address is required", "mac");
                     const auto no_ip = events::parse_detection_event(
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","event_id":"e","event_type":"device.detected"})");
                     require(!no_ip.ok() && no_ip.error() == "ip address is required", "ip");
                     const auto no_id = events::parse_detection_event(
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","ip_address":"10.0.0.1","event_type":"device.detected"})");
                     require(!no_id.ok() && no_id.error() == "event ID is required", "id");
                     const auto no_type = events::parse_detection_event(
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","ip_address":"10.0.0.1","event_id":"e"})");
                     require(!no_type.ok() && no_type.error() == "event type is required", "type");
                     const auto wrong_type = events::parse_detection_event(
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","ip_address":"10.0.0.1","event_id":"e","event_type":"device.gone"})");
                     require(!wrong_type.ok() &&
                                 wrong_type.error() == "invalid event type: device.gone",
                             "wrong type");
                     require(wrong_type.kind() == common::ErrorKind::Validation,
                             "validation kind");
                   }});

  tests.push_back({"parse_detection_event_rejects_malformed_input", [] {
                     require(!events::parse_detection_event("not json").ok(), "garbage");
                     require(!events::parse_detection_event("[]").ok(), "array");
                     const auto bad_time = events::parse_detection_event(
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","ip_address":"10.0.0.1",)"
                         R"("event_id":"e","event_type":"device.detected","detected_at":"noon"})");
                     require(!bad_time.ok() && bad_time.error().find("detected_at") != std::string::npos,
                             "bad timestamp");
                     const auto bad_mac = events::parse_detection_event(
                         R"({"mac_address":"AA:BB","ip_address":"10.0.0.1","event_id":"e","event_type":"device.detected"})");
                     require(!bad_mac.ok(), "bad mac");
                   }});

  tests.push_back({"detection_event_json_round_trip", [] {
                     const auto made = events::make_detection_event("aa:bb:cc:dd:ee:01", "10.2.0.1");
                     require(made.ok(), made.error());
                     const auto json = events::to_json(made.value());
                     const auto parsed = events::parse_detection_event(json);
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().event_id == made.value().event_id, "event id");
                     require(parsed.value().address == "10.2.0.1", "address");
                   }});

  tests.push_back({"generated_event_ids_are_uuid_v4", [] {
                     const std::regex uuid(
                         "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
                     std::set<std::string> seen;
                     for (int i = 0; i < 50; ++i) {
                       const auto id = events::generate_event_id();
                       require(id.ok(), id.error());
                       require(std::regex_match(id.value(), uuid), "not a v4 uuid: " + id.value());
                       seen.insert(id.value());
                     }
                     require(seen.size() == 50, "ids should be unique");
                   }});

  tests.push_back({"status_changed_event_serializes_cause", [] {
                     const auto changed = events::make_status_changed_event(
                         "AA:BB:CC:DD:EE:FF", "registered", "online", "cause-1");
                     require(changed.ok(), changed.error());
                     const auto json = events::to_json(changed.value());
                     const auto values = common::json_parse_flat(json);
                     require(values.at("event_type") == "device.status_changed", "type");
                     require(values.at("mac_address") == "AA:BB:CC:DD:EE:FF", "mac");
                     require(values.at("previous_status") == "registered", "previous");
                     require(values.at("status") == "online", "status");
                     require(values.at("cause_event_id") == "cause-1", "cause");
                     require(common::parse_rfc3339(values.at("changed_at")).ok(), "changed_at");
                   }});

  tests.push_back({"subjects_join_prefix", [] {
                     require(events::detected_subject("farm.north") == "farm.north.device.detected",
                             "detected subject");
                     require(events::detected_subject("farm.") == "farm.device.detected",
                             "trailing dot prefix");
                     require(events::status_changed_subject("farm") ==
                                 "farm.device.status_changed",
                             "status subject");
                     require(events::detected_subject("") == "device.detected", "empty prefix");
                   }});

  tests.push_back({"detection_handler_rejects_unknown_subject", [] {
                     HandlerFixture f;
                     const auto status =
                         f.handler.handle(common::Context::background(), "farm.other", kValidPayload);
                     require(!status.ok() && status.error() == "unknown subject: farm.other",
                             "unknown subject");
                   }});

  tests.push_back({"detection_handler_rejects_wrong_event_type", [] {
                     HandlerFixture f;
                     const auto wrong = f.handler.handle(
                         common::Context::background(), f.handler.subject(),
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","event_type":"device.lost"})");
                     require(!wrong.ok() && wrong.error() == "invalid event type: device.lost",
                             "wrong type message");
                     const auto missing = f.handler.handle(common::Context::background(),
                                                           f.handler.subject(), R"({"x":1})");
                     require(!missing.ok() && missing.error() == "invalid event type: <missing>",
                             "missing type message");
                   }});

  tests.push_back({"detection_handler_records_parse_failures", [] {
                     HandlerFixture f;
                     const auto status = f.handler.handle(
                         common::Context::background(), f.handler.subject(),
                         R"({"mac_address":"AA:BB:CC:DD:EE:FF","event_id":"e-9","event_type":"device.detected"})");
                     require(!status.ok() && status.error() == "ip address is required",
                             "missing ip should fail");
                     const auto errors = f.observer.events_of<obs::ErrorEvent>();
                     require(errors.size() == 1 && errors[0].component == "ingest",
                             "ingest error recorded");
                     require(errors[0].event_id == "e-9", "event id carried");
                   }});

  tests.push_back({"detection_handler_dispatches_valid_events", [] {
                     HandlerFixture f;
                     testing::seed_device(*f.store, "AA:BB:CC:DD:EE:FF", "192.168.1.40");
                     const auto status = f.handler.handle(common::Context::background(),
                                                          f.handler.subject(), kValidPayload);
                     require(status.ok(), status.error());
                     require(testing::wait_until([&f]() {
                               auto found = f.store->find_by_identifier(common::Context::background(),
                                                                        "AA:BB:CC:DD:EE:FF");
                               return found.ok() && found.value().has_value() &&
                                      found.value()->status == devices::DeviceStatus::Online;
                             }),
                             "device should become online");
                     const auto urls = f.client->urls();
                     require(urls.size() == 1 && urls[0] == "http://192.168.1.40/whoami",
                             "probe url mismatch");
                   }});
}
