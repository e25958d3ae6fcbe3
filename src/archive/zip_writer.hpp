#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::archive {

struct ZipEntryView {
  std::string_view name;
  std::string_view bytes;
};

struct ZipOptions {
  // DEFLATE via zlib when true, STORE otherwise. An entry that does not
  // shrink under DEFLATE is stored regardless.
  bool deflate = true;
  int level = 6;
};

// True when this process can produce DEFLATE streams.
bool DeflateAvailable();

// Builds a complete zip32 archive in memory.
//
// Contract:
// - entries are written in the given order, names used verbatim (UTF-8
//   flag set); names must be non-empty, relative, unique and free of `..`
//   segments.
// - every entry carries a CRC-32 and a fixed 1980-01-01 timestamp so equal
//   inputs give byte-identical archives.
// - returns false and sets `error` on invalid input or a zlib failure;
//   `archive_bytes` is left untouched in that case.
bool BuildZipArchive(const std::vector<ZipEntryView>& entries, const ZipOptions& options,
                     std::string& archive_bytes, std::string& error);

// Builds the archive and publishes it at `output_path` via a staged write
// plus rename. Nothing is left at `output_path` when this fails.
bool WriteZipArchive(const std::vector<ZipEntryView>& entries, const ZipOptions& options,
                     const std::filesystem::path& output_path, std::string& error);

} // namespace permitpack::archive
