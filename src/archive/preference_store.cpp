#include "archive/preference_store.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <system_error>
#include <utility>

namespace permitpack::archive {

std::optional<std::string> InMemoryPreferenceStore::Get(std::string_view key) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryPreferenceStore::Set(std::string_view key, std::string_view value,
                                  std::string& error) {
  if (key.empty()) {
    error = "preference key cannot be empty";
    return false;
  }
  values_[std::string(key)] = std::string(value);
  return true;
}

JsonFilePreferenceStore::JsonFilePreferenceStore(std::filesystem::path path)
    : path_(std::move(path)) {}

bool JsonFilePreferenceStore::Load(std::string& error) {
  values_.clear();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return true;
  }

  std::string text;
  if (!core::ReadFileBytes(path_, text, error)) {
    return false;
  }
  core::json::Value root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid preference file '" + path_.string() + "': " + error;
    return false;
  }
  if (root.type != core::json::Value::Type::kObject) {
    error = "preference file '" + path_.string() + "' must hold a JSON object";
    return false;
  }
  for (const auto& [key, value] : root.object_value) {
    if (value.type != core::json::Value::Type::kString) {
      error = "preference '" + key + "' must be a string";
      values_.clear();
      return false;
    }
    values_[key] = value.string_value;
  }
  return true;
}

std::optional<std::string> JsonFilePreferenceStore::Get(std::string_view key) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool JsonFilePreferenceStore::Set(std::string_view key, std::string_view value,
                                  std::string& error) {
  if (key.empty()) {
    error = "preference key cannot be empty";
    return false;
  }

  auto updated = values_;
  updated[std::string(key)] = std::string(value);

  std::string text = "{";
  bool first = true;
  for (const auto& [name, stored] : updated) {
    text += first ? "\n" : ",\n";
    text += "  " + core::QuoteJson(name) + ": " + core::QuoteJson(stored);
    first = false;
  }
  text += "\n}\n";

  if (!core::WriteFileAtomic(path_, text, error)) {
    return false;
  }
  values_ = std::move(updated);
  return true;
}

} // namespace permitpack::archive
