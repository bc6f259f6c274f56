#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace synmem::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

/// Thrown by the require helpers; anything else escaping a case is reported as an error.
class TestFailure : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw TestFailure(message);
  }
}

inline void require_contains(const std::string &text, const std::string &needle,
                             const std::string &what) {
  if (text.find(needle) == std::string::npos) {
    throw TestFailure(what + ": expected to find '" + needle + "' in '" + text + "'");
  }
}

} // namespace synmem::tests
