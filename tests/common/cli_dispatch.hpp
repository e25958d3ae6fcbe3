#ifndef PERMITPACK_TESTS_COMMON_CLI_DISPATCH_HPP_
#define PERMITPACK_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "permitpack/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace permitpack::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return permitpack::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Restores std::cout's buffer on scope exit.
class ScopedStdoutCapture {
public:
  ScopedStdoutCapture() : previous_(std::cout.rdbuf(captured_.rdbuf())) {}
  ~ScopedStdoutCapture() {
    std::cout.rdbuf(previous_);
  }
  ScopedStdoutCapture(const ScopedStdoutCapture&) = delete;
  ScopedStdoutCapture& operator=(const ScopedStdoutCapture&) = delete;

  std::string Text() const {
    return captured_.str();
  }

private:
  std::ostringstream captured_;
  std::streambuf* previous_ = nullptr;
};

inline int DispatchArgsCapturingStdout(const std::vector<std::string>& argv_storage,
                                       std::string& stdout_text) {
  ScopedStdoutCapture capture;
  const int exit_code = DispatchArgs(argv_storage);
  stdout_text = capture.Text();
  return exit_code;
}

} // namespace permitpack::tests::common

#endif // PERMITPACK_TESTS_COMMON_CLI_DISPATCH_HPP_
