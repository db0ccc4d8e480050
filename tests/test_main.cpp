#include "test_framework.hpp"

#include "distill/observability/global.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<distill::tests::TestCase> &tests);
void register_config_tests(std::vector<distill::tests::TestCase> &tests);
void register_similarity_tests(std::vector<distill::tests::TestCase> &tests);
void register_clustering_tests(std::vector<distill::tests::TestCase> &tests);
void register_scoring_tests(std::vector<distill::tests::TestCase> &tests);
void register_retrieval_tests(std::vector<distill::tests::TestCase> &tests);
void register_provider_tests(std::vector<distill::tests::TestCase> &tests);
void register_store_tests(std::vector<distill::tests::TestCase> &tests);
void register_pipeline_tests(std::vector<distill::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  // Keep test output free of observer log lines.
  distill::observability::set_global_observer(nullptr);

  std::vector<distill::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_similarity_tests(tests);
  register_clustering_tests(tests);
  register_scoring_tests(tests);
  register_retrieval_tests(tests);
  register_provider_tests(tests);
  register_store_tests(tests);
  register_pipeline_tests(tests);

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
