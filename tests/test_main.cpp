#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<synmem::tests::TestCase> &tests);
void register_config_tests(std::vector<synmem::tests::TestCase> &tests);
void register_model_tests(std::vector<synmem::tests::TestCase> &tests);
void register_observability_tests(std::vector<synmem::tests::TestCase> &tests);
void register_schema_tests(std::vector<synmem::tests::TestCase> &tests);
void register_storage_tests(std::vector<synmem::tests::TestCase> &tests);
void register_context_tests(std::vector<synmem::tests::TestCase> &tests);
void register_service_tests(std::vector<synmem::tests::TestCase> &tests);
void register_cli_tests(std::vector<synmem::tests::TestCase> &tests);

int main(int argc, char **argv) {
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<synmem::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_model_tests(tests);
  register_observability_tests(tests);
  register_schema_tests(tests);
  register_storage_tests(tests);
  register_context_tests(tests);
  register_service_tests(tests);
  register_cli_tests(tests);

  // Optional arguments select cases whose name contains any of them.
  const std::vector<std::string> filters(argv + 1, argv + argc);
  const auto selected = [&filters](const std::string &name) {
    if (filters.empty()) {
      return true;
    }
    for (const auto &filter : filters) {
      if (name.find(filter) != std::string::npos) {
        return true;
      }
    }
    return false;
  };

  std::size_t ran = 0;
  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    if (!selected(test.name)) {
      continue;
    }
    ++ran;
    try {
      test.fn();
      ++passed;
    } catch (const synmem::tests::TestFailure &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[ERROR] " << test.name << ": unexpected exception: " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << ran << " of " << tests.size() << " tests: " << passed << " passed, "
            << failed << " failed\n";

  return failed == 0 ? 0 : 1;
}
