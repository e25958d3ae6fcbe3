#pragma once

#include "core/validation.hpp"
#include "documents/document_model.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::project {

struct Project {
  documents::ProjectInfo info;
  std::vector<documents::DocumentRecord> documents;
  // Directory relative document paths are resolved against.
  std::filesystem::path base_dir;
};

// Parses a project document:
//
//   {
//     "name": "...", "jurisdiction": "...", "facility_address": "...",
//     "permit_number": "...", "contact_email": "...", "contact_phone": "...",
//     "documents": [
//       {"id": "d1", "category": "site_plan", "file_name": "site.pdf",
//        "status": "approved", "version": 1, "path": "files/site.pdf"}
//     ]
//   }
//
// Contract:
// - returns false only when the text is not JSON; schema problems go to
//   `issues` and the project should not be used when any were reported.
// - `name` and `documents` are required. Each document needs a non-empty
//   `id`, a `category` string (unknown names become `other`), `file_name`,
//   a known `status` and a positive integer `version` (default 1).
// - an optional inline `content` string stands in for `path`.
// - ids are unique and (category, version) pairs are unique.
bool ParseProjectText(std::string_view json_text, Project& project,
                      std::vector<core::ValidationIssue>& issues, std::string& error);

// Reads the file and sets `base_dir` to its parent directory.
bool LoadProjectFile(const std::filesystem::path& project_path, Project& project,
                     std::vector<core::ValidationIssue>& issues, std::string& error);

} // namespace permitpack::project
