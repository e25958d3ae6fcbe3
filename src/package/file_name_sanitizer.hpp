#pragma once

#include <string>
#include <string_view>

namespace permitpack::package {

inline constexpr const char* kUnnamedEntry = "unnamed";
inline constexpr const char* kDocumentsArchiveSuffix = "_Documents.zip";
inline constexpr const char* kSubmissionArchiveSuffix = "_Submission.zip";

// Replaces each of <>:"/\|?* with '_' and trims surrounding whitespace. A
// name that ends up empty becomes "unnamed". Idempotent.
std::string SanitizeFileName(std::string_view name);

// Replaces every byte that is not an ASCII letter or digit with '_'. An
// empty project name becomes "unnamed".
std::string SanitizeProjectName(std::string_view project_name);

// "{SanitizedProject}_Documents.zip".
std::string DocumentsArchiveName(std::string_view project_name);

// "{SanitizedProject}_Submission.zip", used by the download fallback.
std::string SubmissionArchiveName(std::string_view project_name);

} // namespace permitpack::package
