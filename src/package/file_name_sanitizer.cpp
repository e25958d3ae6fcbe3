#include "package/file_name_sanitizer.hpp"

#include "core/text_utils.hpp"

#include <cctype>

namespace permitpack::package {

namespace {

constexpr std::string_view kReservedCharacters = "<>:\"/\\|?*";

} // namespace

std::string SanitizeFileName(std::string_view name) {
  std::string replaced(name);
  for (char& c : replaced) {
    if (kReservedCharacters.find(c) != std::string_view::npos) {
      c = '_';
    }
  }
  std::string trimmed = core::Trim(replaced);
  if (trimmed.empty()) {
    return kUnnamedEntry;
  }
  return trimmed;
}

std::string SanitizeProjectName(std::string_view project_name) {
  if (project_name.empty()) {
    return kUnnamedEntry;
  }
  std::string sanitized(project_name);
  for (char& c : sanitized) {
    if (std::isalnum(static_cast<unsigned char>(c)) == 0) {
      c = '_';
    }
  }
  return sanitized;
}

std::string DocumentsArchiveName(std::string_view project_name) {
  return SanitizeProjectName(project_name) + kDocumentsArchiveSuffix;
}

std::string SubmissionArchiveName(std::string_view project_name) {
  return SanitizeProjectName(project_name) + kSubmissionArchiveSuffix;
}

} // namespace permitpack::package
