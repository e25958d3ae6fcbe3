#include "config/app_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cstdlib>

namespace permitpack::config {

namespace {

using JsonValue = core::json::Value;
using core::AddIssue;
using core::ValidationIssue;

const JsonValue* ObjectMember(const JsonValue& root, std::string_view key, std::string_view path,
                              std::vector<ValidationIssue>& issues) {
  const JsonValue* member = core::json::FindMember(root, key);
  if (member == nullptr) {
    return nullptr;
  }
  if (member->type != JsonValue::Type::kObject) {
    AddIssue(issues, std::string(path) + "." + std::string(key), "must be an object");
    return nullptr;
  }
  return member;
}

void ApplyClassifier(const JsonValue& root, AppConfig& config,
                     std::vector<ValidationIssue>& issues) {
  const JsonValue* classifier = ObjectMember(root, "classifier", "$", issues);
  if (classifier == nullptr) {
    return;
  }
  constexpr std::string_view kPath = "$.classifier";
  core::CheckKnownKeys(*classifier, kPath, {"letterhead", "signature_phrase", "footer_prefix"},
                       issues);
  core::ReadOptionalString(*classifier, "letterhead", kPath, config.classifier.letterhead, issues);
  core::ReadOptionalString(*classifier, "signature_phrase", kPath,
                           config.classifier.signature_phrase, issues);
  core::ReadOptionalString(*classifier, "footer_prefix", kPath, config.classifier.footer_prefix,
                           issues);
}

void ApplyCompression(const JsonValue& root, AppConfig& config,
                      std::vector<ValidationIssue>& issues) {
  const JsonValue* compression = ObjectMember(root, "compression", "$", issues);
  if (compression == nullptr) {
    return;
  }
  constexpr std::string_view kPath = "$.compression";
  core::CheckKnownKeys(*compression, kPath, {"enabled", "level"}, issues);
  if (core::json::FindMember(*compression, "enabled") != nullptr) {
    const auto enabled = core::json::ReadBool(*compression, "enabled");
    if (enabled.has_value()) {
      config.compression_enabled = *enabled;
    } else {
      AddIssue(issues, "$.compression.enabled", "must be a boolean");
    }
  }
  core::ReadOptionalInteger(*compression, "level", kPath, 0, 9, config.compression_level, issues);
}

void ApplyContact(const JsonValue& root, AppConfig& config, std::vector<ValidationIssue>& issues) {
  const JsonValue* contact = ObjectMember(root, "contact", "$", issues);
  if (contact == nullptr) {
    return;
  }
  constexpr std::string_view kPath = "$.contact";
  core::CheckKnownKeys(*contact, kPath,
                       {"name", "street_address", "city_state_zip", "email", "phone",
                        "organization"},
                       issues);
  auto& defaults = config.contact;
  core::ReadOptionalString(*contact, "name", kPath, defaults.contact_name, issues);
  core::ReadOptionalString(*contact, "street_address", kPath, defaults.street_address, issues);
  core::ReadOptionalString(*contact, "city_state_zip", kPath, defaults.city_state_zip, issues);
  core::ReadOptionalString(*contact, "email", kPath, defaults.email, issues);
  core::ReadOptionalString(*contact, "phone", kPath, defaults.phone, issues);
  core::ReadOptionalString(*contact, "organization", kPath, defaults.organization, issues);
}

} // namespace

bool ApplyConfigText(std::string_view json_text, AppConfig& config,
                     std::vector<ValidationIssue>& issues, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid config JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(issues, "$", "config must be a JSON object");
    return true;
  }

  core::CheckKnownKeys(root, "$",
                       {"classifier", "cover_letter_format", "compression", "fetch_concurrency",
                        "downloads_dir", "preferences_path", "contact", "log_level"},
                       issues);

  ApplyClassifier(root, config, issues);
  ApplyCompression(root, config, issues);
  ApplyContact(root, config, issues);

  std::string format_name;
  core::ReadOptionalString(root, "cover_letter_format", "$", format_name, issues);
  if (!format_name.empty() &&
      !render::ParseCoverLetterFormat(format_name, config.cover_letter_format)) {
    AddIssue(issues, "$.cover_letter_format", "must be one of docx|pdf|txt");
  }

  core::ReadOptionalInteger(root, "fetch_concurrency", "$", 1, 64, config.fetch_concurrency,
                            issues);

  std::string downloads_dir = config.downloads_dir.string();
  core::ReadOptionalString(root, "downloads_dir", "$", downloads_dir, issues);
  config.downloads_dir = downloads_dir;

  std::string preferences_path = config.preferences_path.string();
  core::ReadOptionalString(root, "preferences_path", "$", preferences_path, issues);
  config.preferences_path = preferences_path;

  std::string log_level;
  core::ReadOptionalString(root, "log_level", "$", log_level, issues);
  if (!log_level.empty()) {
    std::string level_error;
    if (!core::logging::ParseLogLevel(log_level, config.log_level, level_error)) {
      AddIssue(issues, "$.log_level", level_error);
    }
  }
  return true;
}

bool LoadConfigFile(const std::filesystem::path& config_path, AppConfig& config,
                    std::vector<ValidationIssue>& issues, std::string& error) {
  std::string text;
  if (!core::ReadFileBytes(config_path, text, error)) {
    return false;
  }
  if (!ApplyConfigText(text, config, issues, error)) {
    error = config_path.string() + ": " + error;
    return false;
  }
  return true;
}

std::filesystem::path DefaultDownloadsDir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return {};
  }
  return std::filesystem::path(home) / "Downloads";
}

} // namespace permitpack::config
