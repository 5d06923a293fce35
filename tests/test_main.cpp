#include "test_framework.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

void register_dom_tests(std::vector<domshield::tests::TestCase> &tests);
void register_config_tests(std::vector<domshield::tests::TestCase> &tests);
void register_settings_tests(std::vector<domshield::tests::TestCase> &tests);
void register_rules_tests(std::vector<domshield::tests::TestCase> &tests);
void register_runtime_tests(std::vector<domshield::tests::TestCase> &tests);
void register_classifier_tests(std::vector<domshield::tests::TestCase> &tests);
void register_removal_queue_tests(std::vector<domshield::tests::TestCase> &tests);
void register_media_guard_tests(std::vector<domshield::tests::TestCase> &tests);
void register_click_interceptor_tests(std::vector<domshield::tests::TestCase> &tests);
void register_capability_interceptor_tests(std::vector<domshield::tests::TestCase> &tests);
void register_engine_tests(std::vector<domshield::tests::TestCase> &tests);
void register_cli_tests(std::vector<domshield::tests::TestCase> &tests);

int main(int argc, char **argv) {
  std::vector<domshield::tests::TestCase> tests;
  register_dom_tests(tests);
  register_config_tests(tests);
  register_settings_tests(tests);
  register_rules_tests(tests);
  register_runtime_tests(tests);
  register_classifier_tests(tests);
  register_removal_queue_tests(tests);
  register_media_guard_tests(tests);
  register_click_interceptor_tests(tests);
  register_capability_interceptor_tests(tests);
  register_engine_tests(tests);
  register_cli_tests(tests);

  const std::string filter = argc > 1 ? argv[1] : "";
  std::size_t passed = 0;
  std::size_t failed = 0;
  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    try {
      test.fn();
      ++passed;
      std::cout << "[PASS] " << test.name << "\n";
    } catch (const std::exception &ex) {
      ++failed;
      std::cout << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}
