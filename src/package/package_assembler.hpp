#pragma once

#include "archive/zip_writer.hpp"
#include "core/logging/logger.hpp"
#include "documents/document_model.hpp"
#include "render/cover_letter.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::package {

struct PackageEntry {
  std::string name;
  std::string bytes;
  // Empty for the cover letter.
  std::string source_id;
  documents::Category category = documents::Category::kCoverLetter;
};

// Documents left out because their bytes were not available.
struct SkippedDocument {
  std::string id;
  std::string file_name;
  documents::Category category = documents::Category::kOther;
};

// Ordered archive contents for one export request. Entry 0 is always the
// cover letter; the rest follow package order numbered 01, 02, ...
struct PackageManifest {
  std::string project_name;
  std::string archive_name;
  std::vector<PackageEntry> entries;
  std::vector<SkippedDocument> skipped;

  std::size_t TotalBytes() const;
};

struct AssembleOptions {
  render::CoverLetterOptions cover_letter;
};

// Documents that go into an export: the current (highest version) record of
// every known category plus every `other` record, cover letters excluded.
// Input order is kept.
std::vector<documents::DocumentRecord> SelectSubmissionDocuments(
    const std::vector<documents::DocumentRecord>& documents);

// Two-digit ordinal prefix ("01", "02", ... "99", then "100").
std::string EntryPrefix(int ordinal);

// Builds the manifest around an already rendered cover letter.
//
// Contract:
// - cover_letter records in `documents` are dropped; so are records without
//   content, which land in `skipped` and produce one aggregated warning.
// - the remaining records are sorted with ComparePackageOrder, so the result
//   does not depend on input order, then named `{NN}_{SanitizeFileName}`
//   with NN counting only included documents.
// - archive_name is DocumentsArchiveName(project_name).
PackageManifest AssembleWithCoverLetter(render::CoverLetter cover_letter,
                                        const std::vector<documents::DocumentRecord>& documents,
                                        std::string_view project_name,
                                        core::logging::Logger* logger = nullptr);

// Renders the narrative into the cover letter and assembles the manifest.
// Fails only when the cover letter document cannot be serialized.
bool AssemblePackage(std::string_view cover_letter_text,
                     const std::vector<documents::DocumentRecord>& documents,
                     std::string_view project_name, const AssembleOptions& options,
                     PackageManifest& manifest, std::string& error,
                     core::logging::Logger* logger = nullptr);

// Zip views over the manifest entries, in manifest order. The views borrow
// from `manifest`, which must outlive them.
std::vector<archive::ZipEntryView> ZipEntriesOf(const PackageManifest& manifest);

} // namespace permitpack::package
