#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_config_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_common_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_devices_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_health_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_orchestrator_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_events_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_bus_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_observability_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_cli_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_health_pipeline_integration_tests(std::vector<devpulse::tests::TestCase> &tests);
void register_service_integration_tests(std::vector<devpulse::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<devpulse::tests::TestCase> tests;
  register_config_tests(tests);
  register_common_tests(tests);
  register_devices_tests(tests);
  register_health_tests(tests);
  register_orchestrator_tests(tests);
  register_events_tests(tests);
  register_bus_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);
  register_health_pipeline_integration_tests(tests);
  register_service_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
