#pragma once

namespace permitpack::core::errors {

// Process-exit contract for `permitpack` commands.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values let wrappers tell "project not ready" and "user
// cancelled the save" apart from real failures without parsing stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kInputInvalid = 10,
  kNotEligible = 20,
  kCancelled = 30,
  kAssemblyFailed = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace permitpack::core::errors
