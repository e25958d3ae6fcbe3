#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace permitpack::cli {

// Options for one `permitpack package` export, shared by the CLI and
// in-process callers.
struct PackageOptions {
  std::filesystem::path project_path;
  std::filesystem::path config_path;
  // Flat narrative text; placeholders are filled from contact defaults.
  std::filesystem::path narrative_path;
  // Pre-tagged JSON narrative; mutually exclusive with narrative_path.
  std::filesystem::path structured_narrative_path;
  // Exact archive path (native save). Empty disables that strategy unless
  // `interactive` is set.
  std::filesystem::path output_path;
  // Folder for loose files (directory write).
  std::filesystem::path output_dir;
  // Where the last-resort text manifest goes.
  std::filesystem::path manifest_dir = ".";
  std::optional<std::string> letter_date;
  bool interactive = false;
  bool allow_download = true;
  bool force = false;
  std::optional<core::logging::LogLevel> log_level;
};

struct PackageRunResult {
  std::string method;
  std::filesystem::path location;
  std::size_t entry_count = 0;
  std::size_t skipped_count = 0;
};

// Runs the full export pipeline: load, gate on eligibility, fetch, render,
// assemble, persist. Returns a process exit code (see Dispatch).
int ExecutePackage(const PackageOptions& options, PackageRunResult* run_result);

// Routes `permitpack` subcommands. Exit codes:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => project or config file failed validation
//   20 => project not eligible for submission
//   30 => export cancelled by the user
//   40 => package could not be assembled or persisted
int Dispatch(int argc, char** argv);

} // namespace permitpack::cli
