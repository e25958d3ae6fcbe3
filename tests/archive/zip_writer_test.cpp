#include "archive/zip_writer.hpp"

#include "common/temp_dir.hpp"
#include "common/zip_reader.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>
#include <vector>

using permitpack::archive::BuildZipArchive;
using permitpack::archive::ZipEntryView;
using permitpack::archive::ZipOptions;

namespace {

bool RejectsNames(const std::vector<ZipEntryView>& entries, std::string& error) {
  std::string archive = "untouched";
  const bool ok = BuildZipArchive(entries, ZipOptions{}, archive, error);
  REQUIRE(archive == "untouched");
  return !ok;
}

} // namespace

TEST_CASE("Archive entries come back in order with their bytes", "[archive][zip]") {
  const std::string repetitive(4096, 'r');
  const std::vector<ZipEntryView> entries = {
      {"00_Cover_Letter.txt", "Dear Plan Review Staff,\n"},
      {"01_site_plan.pdf", repetitive},
      {"02_empty.pdf", ""},
      {"03_notes \xC3\xA9.txt", "x"},
  };

  std::string archive;
  std::string error;
  REQUIRE(BuildZipArchive(entries, ZipOptions{}, archive, error));
  REQUIRE(archive.substr(0, 4) == std::string("PK\x03\x04", 4));

  const auto read_back = permitpack::tests::common::ReadZipEntries(archive);
  REQUIRE(read_back.size() == entries.size());
  for (std::size_t i = 0; i < entries.size(); ++i) {
    REQUIRE(read_back[i].name == entries[i].name);
    REQUIRE(read_back[i].bytes == entries[i].bytes);
    REQUIRE((read_back[i].flags & 0x0800U) != 0U);
  }
  REQUIRE(read_back[1].method == 8U);
  REQUIRE(read_back[2].method == 0U);
  REQUIRE(read_back[3].method == 0U);
}

TEST_CASE("Store mode never compresses", "[archive][zip]") {
  const std::string repetitive(2048, 'a');
  ZipOptions options;
  options.deflate = false;

  std::string archive;
  std::string error;
  REQUIRE(BuildZipArchive({{"big.txt", repetitive}}, options, archive, error));
  const auto read_back = permitpack::tests::common::ReadZipEntries(archive);
  REQUIRE(read_back.size() == 1U);
  REQUIRE(read_back[0].method == 0U);
  REQUIRE(read_back[0].bytes == repetitive);
}

TEST_CASE("Equal inputs give byte-identical archives", "[archive][zip]") {
  const std::vector<ZipEntryView> entries = {{"a.txt", "alpha alpha alpha"}, {"b.txt", "beta"}};
  std::string first;
  std::string second;
  std::string error;
  REQUIRE(BuildZipArchive(entries, ZipOptions{}, first, error));
  REQUIRE(BuildZipArchive(entries, ZipOptions{}, second, error));
  REQUIRE(first == second);
}

TEST_CASE("Invalid archives are rejected before anything is written", "[archive][zip]") {
  std::string error;
  REQUIRE(RejectsNames({}, error));
  REQUIRE(error.find("at least one entry") != std::string::npos);
  REQUIRE(RejectsNames({{"", "x"}}, error));
  REQUIRE(RejectsNames({{"/etc/passwd", "x"}}, error));
  REQUIRE(RejectsNames({{"docs/../../escape.txt", "x"}}, error));
  REQUIRE(RejectsNames({{"..", "x"}}, error));
  REQUIRE(RejectsNames({{"same.txt", "x"}, {"same.txt", "y"}}, error));
  REQUIRE(error.find("duplicate") != std::string::npos);

  ZipOptions bad_level;
  bad_level.level = 12;
  std::string archive;
  REQUIRE_FALSE(BuildZipArchive({{"a.txt", "x"}}, bad_level, archive, error));
  REQUIRE(archive.empty());
}

TEST_CASE("Failed archive writes leave no output file", "[archive][zip]") {
  const auto root = permitpack::tests::common::CreateUniqueTempDir("permitpack-zip-writer");
  const auto output = root / "out.zip";

  std::string error;
  REQUIRE_FALSE(permitpack::archive::WriteZipArchive({{"a", "1"}, {"a", "2"}}, ZipOptions{},
                                                     output, error));
  REQUIRE_FALSE(std::filesystem::exists(output));
  REQUIRE(permitpack::tests::common::CountDirectoryEntries(root) == 0U);

  REQUIRE(permitpack::archive::WriteZipArchive({{"a", "1"}}, ZipOptions{}, output, error));
  REQUIRE(std::filesystem::exists(output));
  REQUIRE(permitpack::tests::common::CountDirectoryEntries(root) == 1U);

  permitpack::tests::common::RemovePathBestEffort(root);
}
