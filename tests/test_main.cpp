#include "test_framework.hpp"

#include "almanac/observability/global.hpp"
#include "almanac/observability/observer.hpp"

#include <csignal>
#include <memory>
#include <iostream>

void register_common_tests(std::vector<almanac::tests::TestCase> &tests);
void register_config_tests(std::vector<almanac::tests::TestCase> &tests);
void register_schedule_tests(std::vector<almanac::tests::TestCase> &tests);
void register_tools_tests(std::vector<almanac::tests::TestCase> &tests);
void register_provider_tests(std::vector<almanac::tests::TestCase> &tests);
void register_agent_tests(std::vector<almanac::tests::TestCase> &tests);
void register_sessions_tests(std::vector<almanac::tests::TestCase> &tests);
void register_gateway_tests(std::vector<almanac::tests::TestCase> &tests);
void register_heartbeat_tests(std::vector<almanac::tests::TestCase> &tests);
void register_cli_tests(std::vector<almanac::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
  almanac::observability::set_global_observer(
      std::make_unique<almanac::observability::NoopObserver>());

  std::vector<almanac::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_schedule_tests(tests);
  register_tools_tests(tests);
  register_provider_tests(tests);
  register_agent_tests(tests);
  register_sessions_tests(tests);
  register_gateway_tests(tests);
  register_heartbeat_tests(tests);
  register_cli_tests(tests);

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
