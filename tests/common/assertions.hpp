#ifndef JTDV_TESTS_COMMON_ASSERTIONS_HPP_
#define JTDV_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

namespace jtdv::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertEqual(std::string_view actual, std::string_view expected,
                        std::string_view context) {
  if (actual == expected) {
    return;
  }
  std::cerr << context << '\n';
  std::cerr << "expected: [" << expected << "]\n";
  std::cerr << "actual:   [" << actual << "]\n";
  std::abort();
}

inline void AssertExitCode(int actual, int expected, std::string_view context) {
  if (actual == expected) {
    return;
  }
  std::cerr << context << ": expected exit code " << expected << ", got " << actual << '\n';
  std::abort();
}

} // namespace jtdv::tests::common

#endif // JTDV_TESTS_COMMON_ASSERTIONS_HPP_
