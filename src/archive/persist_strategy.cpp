#include "archive/persist_strategy.hpp"

#include "core/fs_utils.hpp"
#include "package/file_name_sanitizer.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace permitpack::archive {

namespace {

AttemptOutcome Outcome(AttemptStatus status, fs::path location, std::string detail) {
  AttemptOutcome outcome;
  outcome.status = status;
  outcome.location = std::move(location);
  outcome.detail = std::move(detail);
  return outcome;
}

AttemptOutcome FromPickFailure(const PickResult& pick) {
  if (pick.status == PickStatus::kCancelled) {
    return Outcome(AttemptStatus::kCancelled, {}, "cancelled by user");
  }
  return Outcome(AttemptStatus::kRecoverableFailure, {},
                 pick.error.empty() ? "picker failed" : pick.error);
}

// Encodes the manifest then publishes it. Encoding errors are fatal, I/O
// errors at the destination are not.
AttemptOutcome WriteArchiveTo(const package::PackageManifest& manifest,
                              const ZipOptions& zip_options, const fs::path& target) {
  std::string archive_bytes;
  std::string error;
  if (!BuildZipArchive(package::ZipEntriesOf(manifest), zip_options, archive_bytes, error)) {
    return Outcome(AttemptStatus::kFatalFailure, {}, "failed to encode archive: " + error);
  }
  if (!core::WriteFileAtomic(target, archive_bytes, error)) {
    return Outcome(AttemptStatus::kRecoverableFailure, {}, error);
  }
  return Outcome(AttemptStatus::kSaved, target, {});
}

bool WriteLooseFile(const fs::path& path, const std::string& bytes, std::string& error) {
  std::ofstream out_file(path, std::ios::binary | std::ios::trunc);
  if (!out_file) {
    error = "failed to open '" + path.string() + "' for writing";
    return false;
  }
  out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!out_file) {
    error = "failed while writing '" + path.string() + "'";
    return false;
  }
  return true;
}

} // namespace

const char* ToString(AttemptStatus status) {
  switch (status) {
  case AttemptStatus::kSaved:
    return "saved";
  case AttemptStatus::kCancelled:
    return "cancelled";
  case AttemptStatus::kUnavailable:
    return "unavailable";
  case AttemptStatus::kRecoverableFailure:
    return "recoverable_failure";
  case AttemptStatus::kFatalFailure:
    return "fatal_failure";
  }
  return "unavailable";
}

std::string ArchiveStem(const std::string& archive_name) {
  constexpr std::string_view kZipExtension = ".zip";
  if (archive_name.size() > kZipExtension.size() &&
      archive_name.compare(archive_name.size() - kZipExtension.size(), kZipExtension.size(),
                           kZipExtension) == 0) {
    return archive_name.substr(0, archive_name.size() - kZipExtension.size());
  }
  return archive_name;
}

std::string BuildTextManifest(const package::PackageManifest& manifest) {
  std::ostringstream out;
  out << "Submission package: " << manifest.archive_name << '\n'
      << "Project: " << manifest.project_name << '\n'
      << "Files: " << manifest.entries.size() << "\n\n"
      << "Contents (in order):\n";
  for (const auto& entry : manifest.entries) {
    out << "  " << entry.name << "  (" << entry.bytes.size() << " bytes)\n";
  }
  if (!manifest.skipped.empty()) {
    out << "\nSkipped (content unavailable):\n";
    for (const auto& skipped : manifest.skipped) {
      out << "  - " << skipped.file_name << " (" << documents::ToString(skipped.category)
          << ")\n";
    }
  }
  out << "\nThe archive could not be saved. Retry the export, or download the documents\n"
      << "individually and submit them in the order listed above.\n";
  return out.str();
}

NativeSaveStrategy::NativeSaveStrategy(ISaveTargetPicker* picker, ZipOptions zip_options)
    : picker_(picker), zip_options_(zip_options) {}

AttemptOutcome NativeSaveStrategy::Attempt(const package::PackageManifest& manifest,
                                           const std::string& suggested_name) {
  if (picker_ == nullptr) {
    return Outcome(AttemptStatus::kUnavailable, {}, "no save picker in this context");
  }
  const PickResult pick = picker_->PickSaveTarget(suggested_name);
  if (pick.status != PickStatus::kPicked) {
    return FromPickFailure(pick);
  }
  return WriteArchiveTo(manifest, zip_options_, pick.path);
}

DirectoryWriteStrategy::DirectoryWriteStrategy(IDirectoryPicker* picker,
                                               IPreferenceStore* preferences)
    : picker_(picker), preferences_(preferences) {}

AttemptOutcome DirectoryWriteStrategy::Attempt(const package::PackageManifest& manifest,
                                               const std::string& suggested_name) {
  if (picker_ == nullptr) {
    return Outcome(AttemptStatus::kUnavailable, {}, "no directory picker in this context");
  }

  std::optional<fs::path> start_dir;
  if (preferences_ != nullptr) {
    if (const auto last = preferences_->Get(kLastDownloadPathKey); last.has_value()) {
      start_dir = fs::path(*last);
    }
  }

  const PickResult pick = picker_->PickDirectory(start_dir);
  if (pick.status != PickStatus::kPicked) {
    return FromPickFailure(pick);
  }

  std::error_code ec;
  fs::create_directories(pick.path, ec);
  if (ec) {
    return Outcome(AttemptStatus::kRecoverableFailure, {},
                   "failed to create '" + pick.path.string() + "': " + ec.message());
  }

  const fs::path target = core::FirstFreePath(pick.path / ArchiveStem(suggested_name));
  const fs::path staging = core::detail::BuildStagingPath(target);
  fs::create_directory(staging, ec);
  if (ec) {
    return Outcome(AttemptStatus::kRecoverableFailure, {},
                   "failed to create staging folder '" + staging.string() + "': " + ec.message());
  }

  std::string error;
  for (const auto& entry : manifest.entries) {
    if (!WriteLooseFile(staging / entry.name, entry.bytes, error)) {
      std::error_code cleanup_ec;
      (void)fs::remove_all(staging, cleanup_ec);
      return Outcome(AttemptStatus::kRecoverableFailure, {}, error);
    }
  }
  if (!core::PublishStagedDirectory(staging, target, error)) {
    return Outcome(AttemptStatus::kRecoverableFailure, {}, error);
  }

  std::string detail;
  if (preferences_ != nullptr &&
      !preferences_->Set(kLastDownloadPathKey, pick.path.string(), error)) {
    detail = "could not remember folder: " + error;
  }
  return Outcome(AttemptStatus::kSaved, target, detail);
}

DownloadStrategy::DownloadStrategy(fs::path downloads_dir, ZipOptions zip_options)
    : downloads_dir_(std::move(downloads_dir)), zip_options_(zip_options) {}

AttemptOutcome DownloadStrategy::Attempt(const package::PackageManifest& manifest,
                                         const std::string& /*suggested_name*/) {
  if (downloads_dir_.empty()) {
    return Outcome(AttemptStatus::kUnavailable, {}, "no downloads directory");
  }
  if (!zip_options_.deflate || !DeflateAvailable()) {
    return Outcome(AttemptStatus::kUnavailable, {}, "compression unavailable");
  }
  return WriteArchiveTo(manifest, zip_options_,
                        downloads_dir_ / package::SubmissionArchiveName(manifest.project_name));
}

TextManifestStrategy::TextManifestStrategy(fs::path output_dir)
    : output_dir_(std::move(output_dir)) {}

AttemptOutcome TextManifestStrategy::Attempt(const package::PackageManifest& manifest,
                                             const std::string& suggested_name) {
  if (output_dir_.empty()) {
    return Outcome(AttemptStatus::kUnavailable, {}, "no output directory for manifest");
  }
  const fs::path target = output_dir_ / (ArchiveStem(suggested_name) + "_manifest.txt");
  std::string error;
  if (!core::WriteFileAtomic(target, BuildTextManifest(manifest), error)) {
    return Outcome(AttemptStatus::kRecoverableFailure, {}, error);
  }
  return Outcome(AttemptStatus::kSaved, target, {});
}

} // namespace permitpack::archive
