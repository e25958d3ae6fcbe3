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
using permitpack::tests::common::AssertNotContains;
using permitpack::tests::common::Fail;

int main() {
  const fs::path root = permitpack::tests::common::CreateUniqueTempDir("permitpack-narrative-cli");
  const fs::path narrative_path = root / "narrative.txt";
  permitpack::tests::common::WriteTextFile(narrative_path,
                                           "**Intralog Permit Services**\n"
                                           "October 19, 2026\n"
                                           "\n"
                                           "**2. Facility Plan**\n"
                                           "Files Submitted:\n"
                                           "    floor_plan (2 copies).pdf\n"
                                           "Regards from [Your Name]\n");

  std::ostringstream captured_cerr;
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());

  std::string stdout_text;
  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "classify", narrative_path.string()}, stdout_text),
                 0, "classify");
  AssertContains(stdout_text, "0\theader\tIntralog Permit Services\n");
  AssertContains(stdout_text, "1\tdate\tOctober 19, 2026\n");
  AssertContains(stdout_text, "3\tcategory_heading\t2. Facility Plan\n");
  AssertContains(stdout_text, "4\tfiles_header\tFiles Submitted:\n");
  AssertContains(stdout_text, "5\tfile_entry\tfloor_plan.pdf\n");
  AssertContains(stdout_text, "6\tbody\tRegards from [Your Name]\n");

  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "render", narrative_path.string(), "--format", "txt"},
                     stdout_text),
                 0, "render txt");
  AssertContains(stdout_text, "Intralog Permit Services\nOctober 19, 2026\n\n2. Facility Plan\n");
  AssertContains(stdout_text, "    floor_plan.pdf\n");
  AssertNotContains(stdout_text, "**");

  AssertExitCode(permitpack::tests::common::DispatchArgs(
                     {"permitpack", "render", narrative_path.string()}),
                 2, "render docx without --out");

  const fs::path docx_path = root / "letter.docx";
  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "render", narrative_path.string(), "--out",
                      docx_path.string()},
                     stdout_text),
                 0, "render docx");
  AssertContains(stdout_text, "(7 paragraphs)");
  if (permitpack::tests::common::ReadFileToString(docx_path).compare(0, 2, "PK") != 0) {
    Fail("rendered docx lacks the zip signature");
  }

  const fs::path structured_path = root / "narrative.json";
  permitpack::tests::common::WriteTextFile(
      structured_path,
      R"([{"role":"header","text":"Intralog Permit Services"},{"role":"aside","text":"hi"}])");
  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "render", structured_path.string(), "--structured",
                      "--format", "txt"},
                     stdout_text),
                 0, "render structured");
  if (stdout_text != "Intralog Permit Services\nhi\n") {
    Fail("unexpected structured render: " + stdout_text);
  }
  AssertContains(captured_cerr.str(), "unknown narrative role rendered as body");

  const fs::path project_path = permitpack::tests::common::WriteSampleProject(root / "project");
  AssertExitCode(permitpack::tests::common::DispatchArgsCapturingStdout(
                     {"permitpack", "cover-letter", project_path.string(), "--date",
                      "October 19, 2026"},
                     stdout_text),
                 0, "cover-letter");
  AssertContains(stdout_text, "Intralog Permit Services\nOctober 19, 2026\n");
  AssertContains(stdout_text, "1. Site Plan\nFiles Submitted:\n    site_plan.pdf\n");
  AssertContains(stdout_text, "Email: ops@example.com\n");
  AssertNotContains(stdout_text, "draft_cover.docx");

  std::cerr.rdbuf(original_cerr);
  permitpack::tests::common::RemovePathBestEffort(root);
  return 0;
}
