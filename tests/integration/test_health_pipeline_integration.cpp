#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devpulse/devices/memory_store.hpp"
#include "devpulse/events/detection.hpp"
#include "devpulse/health/orchestrator.hpp"
#include "devpulse/http/client.hpp"

namespace {

namespace common = devpulse::common;
namespace devices = devpulse::devices;
namespace events = devpulse::events;
namespace health = devpulse::health;
namespace testing = devpulse::testing;
using devpulse::tests::require;
using namespace std::chrono_literals;

struct Pipeline {
  std::shared_ptr<devices::MemoryDeviceStore> store = std::make_shared<devices::MemoryDeviceStore>();
  testing::RecordingObserver observer;
  std::unique_ptr<health::HealthCheckOrchestrator> orchestrator;

  Pipeline() {
    health::ProbeOptions probe_options;
    probe_options.timeout = 1000ms;
    probe_options.user_agent = "devpulse-it/1";
    auto checker = std::make_shared<health::RetryingHealthProbe>(
        health::HealthProbe(std::make_shared<devpulse::http::CurlHttpClient>(), probe_options),
        health::RetryPolicy{.attempts = 2, .initial_delay = 5ms}, observer);
    orchestrator = std::make_unique<health::HealthCheckOrchestrator>(
        store, checker, health::OrchestratorOptions{}, observer);
  }

  health::CheckReport check(const std::string &identifier, const std::string &address) {
    auto event = events::make_detection_event(identifier, address);
    require(event.ok(), event.error());
    auto dispatched = orchestrator->dispatch(event.value());
    require(dispatched.ok(), dispatched.error());
    auto future = dispatched.value();
    require(future.wait_for(10s) == std::future_status::ready, "check timed out");
    return future.get();
  }

  devices::DeviceStatus status_of(const std::string &identifier) {
    auto found = store->find_by_identifier(common::Context::background(), identifier);
    require(found.ok() && found.value().has_value(), "device missing");
    return found.value()->status;
  }
};

} // namespace

void register_health_pipeline_integration_tests(std::vector<devpulse::tests::TestCase> &tests) {
  tests.push_back({"integration_healthy_device_goes_online", [] {
                     testing::LocalHttpResponder responder(200, "{\"name\":\"valve-1\"}");
                     require(responder.ok(), "responder should listen");
                     Pipeline pipeline;
                     testing::seed_device(*pipeline.store, "AA:BB:CC:DD:EE:FF", responder.address());

                     const auto report = pipeline.check("aa:bb:cc:dd:ee:ff", responder.address());
                     require(report.outcome.success, report.outcome.last_error.value_or("failed"));
                     require(report.outcome.status_code == 200, "status code");
                     require(report.outcome.response_snippet == "{\"name\":\"valve-1\"}",
                             "body snippet");
                     require(pipeline.status_of("AA:BB:CC:DD:EE:FF") == devices::DeviceStatus::Online,
                             "device should be online");

                     const auto request = responder.last_request();
                     require(request.rfind("GET /whoami HTTP/1.1\r\n", 0) == 0,
                             "request line mismatch: " + request);
                     require(request.find("User-Agent: devpulse-it/1") != std::string::npos,
                             "user agent header");
                     require(request.find("Accept: application/json, text/plain, */*") !=
                                 std::string::npos,
                             "accept header");
                   }});

  tests.push_back({"integration_unhealthy_device_goes_offline", [] {
                     testing::LocalHttpResponder responder(503, "down");
                     require(responder.ok(), "responder should listen");
                     Pipeline pipeline;
                     testing::seed_device(*pipeline.store, "AA:BB:CC:DD:EE:01", responder.address());

                     const auto report = pipeline.check("AA:BB:CC:DD:EE:01", responder.address());
                     require(!report.outcome.success, "503 is not healthy");
                     require(report.outcome.attempts == 2, "both attempts used");
                     require(responder.requests() == 2, "two requests reached the device");
                     require(report.outcome.last_error.value_or("").find("503") != std::string::npos,
                             "error should name the status");
                     require(pipeline.status_of("AA:BB:CC:DD:EE:01") == devices::DeviceStatus::Offline,
                             "device should be offline");
                   }});

  tests.push_back({"integration_unreachable_device_goes_offline", [] {
                     std::string address;
                     {
                       testing::LocalHttpResponder closed(200);
                       require(closed.ok(), "responder should listen");
                       address = closed.address();
                     }
                     Pipeline pipeline;
                     testing::seed_device(*pipeline.store, "AA:BB:CC:DD:EE:02", address);

                     const auto report = pipeline.check("AA:BB:CC:DD:EE:02", address);
                     require(!report.outcome.success, "nothing listens on the port");
                     require(report.outcome.last_error.has_value(), "transport error reported");
                     require(pipeline.status_of("AA:BB:CC:DD:EE:02") == devices::DeviceStatus::Offline,
                             "device should be offline");
                   }});
}
