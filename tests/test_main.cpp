#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_crypto_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_storage_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_records_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_registry_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_parameter_store_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_config_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_observability_tests(std::vector<paramvault::tests::TestCase> &tests);
void register_cli_tests(std::vector<paramvault::tests::TestCase> &tests);

int main() {
  // Subprocess tests write to children that may exit early.
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<paramvault::tests::TestCase> tests;
  register_common_tests(tests);
  register_crypto_tests(tests);
  register_storage_tests(tests);
  register_records_tests(tests);
  register_registry_tests(tests);
  register_parameter_store_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
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
