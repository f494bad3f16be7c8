#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_config_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_observability_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_transcript_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_heuristics_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_conversation_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_tree_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_sessions_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_loader_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_search_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_cli_tests(std::vector<tracescope::tests::TestCase> &tests);
void register_pipeline_integration_tests(std::vector<tracescope::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
#ifdef SIGPIPE
  std::signal(SIGPIPE, SIG_IGN);
#endif

  std::vector<tracescope::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_transcript_tests(tests);
  register_heuristics_tests(tests);
  register_conversation_tests(tests);
  register_tree_tests(tests);
  register_sessions_tests(tests);
  register_loader_tests(tests);
  register_search_tests(tests);
  register_cli_tests(tests);
  register_pipeline_integration_tests(tests);

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
