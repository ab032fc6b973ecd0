#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_config_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_task_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_security_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_sandbox_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_validator_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_agent_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_harness_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_metrics_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_store_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_cli_tests(std::vector<sweguard::tests::TestCase> &tests);
void register_local_integration_tests(std::vector<sweguard::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<sweguard::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_task_tests(tests);
  register_security_tests(tests);
  register_sandbox_tests(tests);
  register_validator_tests(tests);
  register_agent_tests(tests);
  register_harness_tests(tests);
  register_metrics_tests(tests);
  register_store_tests(tests);
  register_cli_tests(tests);
  register_local_integration_tests(tests);

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
