#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/project_fixtures.hpp"
#include "common/temp_dir.hpp"
#include "common/zip_reader.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using permitpack::tests::common::AssertContains;
using permitpack::tests::common::AssertExitCode;
using permitpack::tests::common::Fail;

int main() {
  const fs::path root = permitpack::tests::common::CreateUniqueTempDir("permitpack-package-e2e");
  permitpack::tests::common::SampleProjectOptions project_options;
  project_options.drop_egress_file = true;
  const fs::path project_path = permitpack::tests::common::WriteSampleProject(root, project_options);
  const fs::path archive_path = root / "out" / "Dock_Street_Warehouse_Documents.zip";

  std::ostringstream captured_cerr;
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());
  std::string stdout_text;
  const int exit_code = permitpack::tests::common::DispatchArgsCapturingStdout(
      {"permitpack", "package", project_path.string(), "--output", archive_path.string(),
       "--no-download", "--manifest-dir", (root / "manifests").string(), "--date",
       "October 19, 2026", "--log-level", "warn"},
      stdout_text);
  std::cerr.rdbuf(original_cerr);

  AssertExitCode(exit_code, 0, "package");
  AssertContains(stdout_text, "Export Complete: Dock_Street_Warehouse_Documents.zip");
  AssertContains(stdout_text, "method: native_save\n");
  AssertContains(stdout_text, "entries: 7\n");
  AssertContains(stdout_text, "skipped: 1\n");
  AssertContains(captured_cerr.str(), "documents skipped: content unavailable");
  AssertContains(captured_cerr.str(), "egress.pdf");

  const auto entries = permitpack::tests::common::ReadZipEntries(
      permitpack::tests::common::ReadFileToString(archive_path));
  const std::vector<std::string> expected_names = {
      "00_Cover_Letter.docx",     "01_site_plan.pdf",  "02_floor_plan.pdf",
      "03_special_inspection.pdf", "04_rack_calcs.pdf", "05_sprinklers.pdf",
      "06_commodity_list.xlsx",
  };
  if (entries.size() != expected_names.size()) {
    Fail("unexpected archive entry count");
  }
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (entries[i].name != expected_names[i]) {
      Fail("unexpected archive entry at " + std::to_string(i) + ": " + entries[i].name);
    }
  }
  if (entries[1].bytes != "d-site payload\n") {
    Fail("site plan bytes changed in the archive");
  }

  // The cover letter is itself a docx package naming every included file.
  const auto cover_parts = permitpack::tests::common::ReadZipEntries(entries[0].bytes);
  const auto* document_xml = permitpack::tests::common::FindZipEntry(cover_parts,
                                                                      "word/document.xml");
  if (document_xml == nullptr) {
    Fail("cover letter lacks word/document.xml");
  }
  AssertContains(document_xml->bytes, "Dock Street Warehouse");
  AssertContains(document_xml->bytes, "October 19, 2026");
  AssertContains(document_xml->bytes, "rack_calcs.pdf");
  permitpack::tests::common::AssertNotContains(document_xml->bytes, "egress.pdf");
  permitpack::tests::common::AssertNotContains(document_xml->bytes, "draft_cover.docx");

  if (fs::exists(root / "manifests")) {
    Fail("text manifest written although the archive was saved");
  }

  permitpack::tests::common::RemovePathBestEffort(root);
  return 0;
}
