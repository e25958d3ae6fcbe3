#include "permitpack/cli/router.hpp"

#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/project_fixtures.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using permitpack::tests::common::AssertContains;
using permitpack::tests::common::AssertExitCode;
using permitpack::tests::common::Fail;

int main() {
  const fs::path root = permitpack::tests::common::CreateUniqueTempDir("permitpack-gating");
  std::ostringstream captured_cerr;
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());

  // Not eligible: one required category pending review.
  const fs::path pending_root = root / "pending";
  permitpack::tests::common::SampleProjectOptions pending_options;
  pending_options.all_approved = false;
  const fs::path pending_project =
      permitpack::tests::common::WriteSampleProject(pending_root, pending_options);
  const fs::path pending_archive = pending_root / "out.zip";
  std::string stdout_text;
  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "package", pending_project.string(), "--output",
                      pending_archive.string(), "--no-download", "--manifest-dir",
                      (pending_root / "manifests").string()},
                     stdout_text),
                 20, "package on pending project");
  AssertContains(captured_cerr.str(), "not eligible for submission (86%");
  AssertContains(captured_cerr.str(), "Fire Protection");
  if (fs::exists(pending_archive) || fs::exists(pending_root / "manifests")) {
    Fail("ineligible export produced output");
  }

  // Not eligible: everything approved but no cover letter on record.
  const fs::path no_cover_root = root / "no-cover";
  permitpack::tests::common::SampleProjectOptions no_cover_options;
  no_cover_options.include_cover_letter = false;
  const fs::path no_cover_project =
      permitpack::tests::common::WriteSampleProject(no_cover_root, no_cover_options);
  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "progress", no_cover_project.string(), "--json"},
                     stdout_text),
                 0, "progress --json");
  AssertContains(stdout_text, "\"percent\":100");
  AssertContains(stdout_text, "\"eligible\":false");
  AssertContains(stdout_text, "\"has_cover_letter\":false");

  // --force exports anyway; with no save target the chain ends at the text
  // manifest.
  permitpack::cli::PackageOptions forced;
  forced.project_path = no_cover_project;
  forced.allow_download = false;
  forced.force = true;
  forced.manifest_dir = no_cover_root / "manifests";
  forced.letter_date = "October 19, 2026";
  forced.log_level = permitpack::core::logging::LogLevel::kError;
  permitpack::cli::PackageRunResult run_result;
  {
    permitpack::tests::common::ScopedStdoutCapture quiet;
    AssertExitCode(permitpack::cli::ExecutePackage(forced, &run_result), 0, "forced package");
  }
  if (run_result.method != "text_manifest") {
    Fail("expected the text manifest fallback, got " + run_result.method);
  }
  if (run_result.location != no_cover_root / "manifests" / "Dock_Street_Warehouse_Documents_manifest.txt") {
    Fail("unexpected manifest location: " + run_result.location.string());
  }
  const std::string manifest_text = permitpack::tests::common::ReadFileToString(run_result.location);
  AssertContains(manifest_text, "00_Cover_Letter.docx");
  AssertContains(manifest_text, "07_commodity_list.xlsx");

  // Malformed structured narrative: assembly fails before anything is saved.
  const fs::path eligible_root = root / "eligible";
  const fs::path eligible_project = permitpack::tests::common::WriteSampleProject(eligible_root);
  permitpack::tests::common::WriteTextFile(eligible_root / "narrative.json", "{\"role\": 1}");
  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "package", eligible_project.string(),
                      "--structured-narrative", (eligible_root / "narrative.json").string(),
                      "--output", (eligible_root / "out.zip").string(), "--no-download"},
                     stdout_text),
                 40, "package with malformed narrative");
  if (fs::exists(eligible_root / "out.zip")) {
    Fail("archive written despite a malformed narrative");
  }

  // Usage and validation errors.
  AssertExitCode(permitpack::tests::common::DispatchArgs({"permitpack", "package"}), 2,
                 "package without project");
  AssertExitCode(permitpack::tests::common::DispatchArgs(
                     {"permitpack", "package", eligible_project.string(), "--narrative", "a.txt",
                      "--structured-narrative", "b.json"}),
                 2, "both narrative flags");
  permitpack::tests::common::WriteTextFile(root / "bad.json", "{\"documents\": []}");
  AssertExitCode(permitpack::tests::common::DispatchArgs(
                     {"permitpack", "validate", (root / "bad.json").string()}),
                 10, "validate project without name");
  AssertContains(captured_cerr.str(), "$.name: is required");

  std::cerr.rdbuf(original_cerr);
  permitpack::tests::common::RemovePathBestEffort(root);
  return 0;
}
