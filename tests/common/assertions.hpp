#ifndef PERMITPACK_TESTS_COMMON_ASSERTIONS_HPP_
#define PERMITPACK_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace permitpack::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

[[noreturn]] inline void FailWithText(std::string_view expectation, std::string_view needle,
                                      std::string_view text) {
  std::cerr << expectation << ": " << needle << "\n--- actual text ---\n" << text << '\n';
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    FailWithText("expected to find", needle, text);
  }
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    FailWithText("expected not to find", needle, text);
  }
}

// Smoke tests drive the CLI and check its documented exit codes.
inline void AssertExitCode(int actual, int expected, std::string_view context) {
  if (actual != expected) {
    Fail(std::string(context) + ": expected exit code " + std::to_string(expected) + ", got " +
         std::to_string(actual));
  }
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

} // namespace permitpack::tests::common

#endif // PERMITPACK_TESTS_COMMON_ASSERTIONS_HPP_
