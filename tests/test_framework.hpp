#pragma once

#include <functional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sessionrelay::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails with both values printed, e.g. `reply text: expected [a] got [b]`.
template <typename Actual, typename Expected>
void require_eq(const Actual &actual, const Expected &expected, const std::string &what) {
  if (actual == expected) {
    return;
  }
  std::ostringstream message;
  message << what << ": expected [" << expected << "] got [" << actual << "]";
  throw std::runtime_error(message.str());
}

inline void require_contains(const std::string &haystack, const std::string &needle,
                             const std::string &what) {
  if (haystack.find(needle) == std::string::npos) {
    throw std::runtime_error(what + ": [" + needle + "] not found in [" + haystack + "]");
  }
}

} // namespace sessionrelay::tests
