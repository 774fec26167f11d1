#include "test_framework.hpp"

#include "ragsync/observability/global.hpp"
#include "ragsync/observability/noop_observer.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_config_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_observability_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_provider_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_encoder_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_index_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_knowledge_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_sync_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_generation_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_retrieval_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_cli_tests(std::vector<ragsync::tests::TestCase> &tests);
void register_service_integration_tests(std::vector<ragsync::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
  ragsync::observability::set_global_observer(
      std::make_unique<ragsync::observability::NoopObserver>());

  std::vector<ragsync::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_provider_tests(tests);
  register_encoder_tests(tests);
  register_index_tests(tests);
  register_knowledge_tests(tests);
  register_sync_tests(tests);
  register_generation_tests(tests);
  register_retrieval_tests(tests);
  register_cli_tests(tests);
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
