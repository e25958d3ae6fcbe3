#ifndef PERMITPACK_CORE_VALIDATION_HPP_
#define PERMITPACK_CORE_VALIDATION_HPP_

#include "core/json_dom.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace permitpack::core {

// One problem found in a config or project file, addressed by JSON path
// (e.g. `$.documents[2].version`).
struct ValidationIssue {
  std::string path;
  std::string message;
};

inline void AddIssue(std::vector<ValidationIssue>& issues, std::string path, std::string message) {
  issues.push_back({std::move(path), std::move(message)});
}

inline std::string FormatIssues(const std::vector<ValidationIssue>& issues) {
  std::string out;
  for (const auto& issue : issues) {
    out += "  " + issue.path + ": " + issue.message + "\n";
  }
  return out;
}

// Reports every member of `object_value` not named in `known`.
inline void CheckKnownKeys(const json::Value& object_value, std::string_view path,
                           std::initializer_list<std::string_view> known,
                           std::vector<ValidationIssue>& issues) {
  for (const auto& [key, value] : object_value.object_value) {
    bool found = false;
    for (const std::string_view name : known) {
      if (key == name) {
        found = true;
        break;
      }
    }
    if (!found) {
      AddIssue(issues, std::string(path) + "." + key, "unknown key");
    }
  }
}

// Optional string member: absent leaves `out` untouched, a non-string is an
// issue.
inline void ReadOptionalString(const json::Value& object_value, std::string_view key,
                               std::string_view path, std::string& out,
                               std::vector<ValidationIssue>& issues) {
  const json::Value* member = json::FindMember(object_value, key);
  if (member == nullptr) {
    return;
  }
  if (member->type != json::Value::Type::kString) {
    AddIssue(issues, std::string(path) + "." + std::string(key), "must be a string");
    return;
  }
  out = member->string_value;
}

// Optional integer member within [min_value, max_value].
inline void ReadOptionalInteger(const json::Value& object_value, std::string_view key,
                                std::string_view path, std::int64_t min_value,
                                std::int64_t max_value, int& out,
                                std::vector<ValidationIssue>& issues) {
  if (json::FindMember(object_value, key) == nullptr) {
    return;
  }
  const auto value = json::ReadInteger(object_value, key);
  const std::string member_path = std::string(path) + "." + std::string(key);
  if (!value.has_value()) {
    AddIssue(issues, member_path, "must be an integer");
    return;
  }
  if (*value < min_value || *value > max_value) {
    AddIssue(issues, member_path,
             "must be within " + std::to_string(min_value) + ".." + std::to_string(max_value));
    return;
  }
  out = static_cast<int>(*value);
}

} // namespace permitpack::core

#endif // PERMITPACK_CORE_VALIDATION_HPP_
