#pragma once

#include "core/logging/logger.hpp"
#include "core/validation.hpp"
#include "narrative/line_classifier.hpp"
#include "narrative/placeholder_filler.hpp"
#include "render/cover_letter.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::config {

// Runtime settings. Defaults apply when no config file is given.
struct AppConfig {
  narrative::ClassifierProfile classifier;
  render::CoverLetterFormat cover_letter_format = render::CoverLetterFormat::kDocx;
  bool compression_enabled = true;
  int compression_level = 6;
  int fetch_concurrency = 6;
  std::filesystem::path downloads_dir;
  std::filesystem::path preferences_path;
  narrative::ContactDefaults contact;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Applies a config document on top of `config`.
//
// Contract:
// - returns false only when the text is not JSON (error set).
// - otherwise returns true; problems (unknown keys, wrong types, values out
//   of range) are appended to `issues` and the offending setting keeps its
//   previous value.
bool ApplyConfigText(std::string_view json_text, AppConfig& config,
                     std::vector<core::ValidationIssue>& issues, std::string& error);

// Reads and applies a config file. Returns false on I/O or parse failure.
bool LoadConfigFile(const std::filesystem::path& config_path, AppConfig& config,
                    std::vector<core::ValidationIssue>& issues, std::string& error);

// `$HOME/Downloads` when HOME is set, else empty (download fallback off).
std::filesystem::path DefaultDownloadsDir();

} // namespace permitpack::config
