#include "package/package_assembler.hpp"

#include "documents/category_order.hpp"
#include "package/file_name_sanitizer.hpp"
#include "progress/progress_calculator.hpp"

#include <algorithm>

namespace permitpack::package {

namespace {

std::string JoinSkippedNames(const std::vector<SkippedDocument>& skipped) {
  std::string joined;
  for (const auto& document : skipped) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += document.file_name;
  }
  return joined;
}

} // namespace

std::size_t PackageManifest::TotalBytes() const {
  std::size_t total = 0;
  for (const auto& entry : entries) {
    total += entry.bytes.size();
  }
  return total;
}

std::vector<documents::DocumentRecord> SelectSubmissionDocuments(
    const std::vector<documents::DocumentRecord>& documents) {
  const auto current = progress::SelectCurrentDocuments(documents);
  const auto is_current = [&current](const documents::DocumentRecord& record) {
    return std::any_of(current.begin(), current.end(),
                       [&record](const documents::DocumentRecord& pick) {
                         return pick.id == record.id && pick.category == record.category &&
                                pick.version == record.version;
                       });
  };

  std::vector<documents::DocumentRecord> selected;
  for (const auto& record : documents) {
    if (record.category == documents::Category::kCoverLetter) {
      continue;
    }
    if (record.category == documents::Category::kOther || is_current(record)) {
      selected.push_back(record);
    }
  }
  return selected;
}

std::string EntryPrefix(int ordinal) {
  std::string prefix = std::to_string(ordinal);
  if (prefix.size() < 2U) {
    prefix.insert(0, 2U - prefix.size(), '0');
  }
  return prefix;
}

PackageManifest AssembleWithCoverLetter(render::CoverLetter cover_letter,
                                        const std::vector<documents::DocumentRecord>& documents,
                                        std::string_view project_name,
                                        core::logging::Logger* logger) {
  PackageManifest manifest;
  manifest.project_name = std::string(project_name);
  manifest.archive_name = DocumentsArchiveName(project_name);

  PackageEntry cover_entry;
  cover_entry.name = std::move(cover_letter.entry_name);
  cover_entry.bytes = std::move(cover_letter.bytes);
  manifest.entries.push_back(std::move(cover_entry));

  std::vector<const documents::DocumentRecord*> included;
  for (const auto& document : documents) {
    if (document.category == documents::Category::kCoverLetter) {
      continue;
    }
    if (!document.content.has_value()) {
      manifest.skipped.push_back({document.id, document.file_name, document.category});
      continue;
    }
    included.push_back(&document);
  }

  std::sort(included.begin(), included.end(),
            [](const documents::DocumentRecord* lhs, const documents::DocumentRecord* rhs) {
              return documents::ComparePackageOrder(*lhs, *rhs);
            });

  int ordinal = 0;
  for (const auto* document : included) {
    PackageEntry entry;
    entry.name = EntryPrefix(++ordinal) + "_" + SanitizeFileName(document->file_name);
    entry.bytes = *document->content;
    entry.source_id = document->id;
    entry.category = document->category;
    manifest.entries.push_back(std::move(entry));
  }

  if (logger != nullptr) {
    if (!manifest.skipped.empty()) {
      logger->Warn("documents skipped: content unavailable",
                   {{"count", std::to_string(manifest.skipped.size())},
                    {"files", JoinSkippedNames(manifest.skipped)}});
    }
    logger->Info("package assembled",
                 {{"archive", manifest.archive_name},
                  {"entries", std::to_string(manifest.entries.size())},
                  {"bytes", std::to_string(manifest.TotalBytes())}});
  }
  return manifest;
}

bool AssemblePackage(std::string_view cover_letter_text,
                     const std::vector<documents::DocumentRecord>& documents,
                     std::string_view project_name, const AssembleOptions& options,
                     PackageManifest& manifest, std::string& error,
                     core::logging::Logger* logger) {
  render::CoverLetter cover_letter;
  if (!render::RenderCoverLetter(cover_letter_text, options.cover_letter, cover_letter, error,
                                 logger)) {
    return false;
  }
  manifest = AssembleWithCoverLetter(std::move(cover_letter), documents, project_name, logger);
  return true;
}

std::vector<archive::ZipEntryView> ZipEntriesOf(const PackageManifest& manifest) {
  std::vector<archive::ZipEntryView> views;
  views.reserve(manifest.entries.size());
  for (const auto& entry : manifest.entries) {
    views.push_back({entry.name, entry.bytes});
  }
  return views;
}

} // namespace permitpack::package
