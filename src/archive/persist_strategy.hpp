#pragma once

#include "archive/pickers.hpp"
#include "archive/preference_store.hpp"
#include "archive/zip_writer.hpp"
#include "package/package_assembler.hpp"

#include <filesystem>
#include <string>

namespace permitpack::archive {

enum class AttemptStatus {
  kSaved,
  // The user backed out; the chain stops and nothing is written.
  kCancelled,
  // The capability is absent in this context; try the next strategy.
  kUnavailable,
  // The capability exists but failed; logged, then the next strategy runs.
  kRecoverableFailure,
  // The package itself cannot be encoded; the chain stops.
  kFatalFailure,
};

const char* ToString(AttemptStatus status);

struct AttemptOutcome {
  AttemptStatus status = AttemptStatus::kUnavailable;
  std::filesystem::path location;
  std::string detail;
};

// One way of getting a package onto disk.
class IPersistStrategy {
public:
  virtual ~IPersistStrategy() = default;

  // Stable method name used in logs and PersistResult ("native_save", ...).
  virtual const char* Name() const = 0;

  // Must leave no files behind unless it returns kSaved.
  virtual AttemptOutcome Attempt(const package::PackageManifest& manifest,
                                 const std::string& suggested_name) = 0;
};

// Writes the zip archive at the exact path a save picker returns.
// Unavailable without a picker.
class NativeSaveStrategy final : public IPersistStrategy {
public:
  NativeSaveStrategy(ISaveTargetPicker* picker, ZipOptions zip_options);

  const char* Name() const override {
    return "native_save";
  }
  AttemptOutcome Attempt(const package::PackageManifest& manifest,
                         const std::string& suggested_name) override;

private:
  ISaveTargetPicker* picker_ = nullptr;
  ZipOptions zip_options_;
};

// Writes every entry as a loose file into `<picked dir>/<archive stem>/`.
// The folder is filled under a staging name and renamed into place in one
// step. An existing folder of that name is left alone and the export goes to
// `<archive stem> (2)`, `(3)`... instead. The picked directory is remembered
// under kLastDownloadPathKey.
class DirectoryWriteStrategy final : public IPersistStrategy {
public:
  DirectoryWriteStrategy(IDirectoryPicker* picker, IPreferenceStore* preferences);

  const char* Name() const override {
    return "directory_write";
  }
  AttemptOutcome Attempt(const package::PackageManifest& manifest,
                         const std::string& suggested_name) override;

private:
  IDirectoryPicker* picker_ = nullptr;
  IPreferenceStore* preferences_ = nullptr;
};

// Writes `{Project}_Submission.zip` into the downloads directory without
// asking. Unavailable when compression is off or zlib cannot deflate, or
// when no downloads directory is known.
class DownloadStrategy final : public IPersistStrategy {
public:
  DownloadStrategy(std::filesystem::path downloads_dir, ZipOptions zip_options);

  const char* Name() const override {
    return "download";
  }
  AttemptOutcome Attempt(const package::PackageManifest& manifest,
                         const std::string& suggested_name) override;

private:
  std::filesystem::path downloads_dir_;
  ZipOptions zip_options_;
};

// Last resort: `{archive stem}_manifest.txt` listing the package contents
// and how to collect the files by hand.
class TextManifestStrategy final : public IPersistStrategy {
public:
  explicit TextManifestStrategy(std::filesystem::path output_dir);

  const char* Name() const override {
    return "text_manifest";
  }
  AttemptOutcome Attempt(const package::PackageManifest& manifest,
                         const std::string& suggested_name) override;

private:
  std::filesystem::path output_dir_;
};

// "Foo_Documents.zip" -> "Foo_Documents".
std::string ArchiveStem(const std::string& archive_name);

// Body of the text manifest.
std::string BuildTextManifest(const package::PackageManifest& manifest);

} // namespace permitpack::archive
