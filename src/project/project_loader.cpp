#include "project/project_loader.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <limits>
#include <set>
#include <utility>

namespace permitpack::project {

namespace {

using JsonValue = core::json::Value;
using core::AddIssue;
using core::ValidationIssue;

void ReadRequiredString(const JsonValue& object_value, std::string_view key,
                        const std::string& path, std::string& out,
                        std::vector<ValidationIssue>& issues) {
  const JsonValue* member = core::json::FindMember(object_value, key);
  const std::string member_path = path + "." + std::string(key);
  if (member == nullptr) {
    AddIssue(issues, member_path, "is required");
    return;
  }
  if (member->type != JsonValue::Type::kString) {
    AddIssue(issues, member_path, "must be a string");
    return;
  }
  if (member->string_value.empty()) {
    AddIssue(issues, member_path, "must not be empty");
    return;
  }
  out = member->string_value;
}

bool ParseDocument(const JsonValue& element, const std::string& path,
                   documents::DocumentRecord& record, std::vector<ValidationIssue>& issues) {
  if (element.type != JsonValue::Type::kObject) {
    AddIssue(issues, path, "must be an object");
    return false;
  }
  const std::size_t issues_before = issues.size();

  core::CheckKnownKeys(element, path,
                       {"id", "category", "file_name", "status", "version", "path", "content"},
                       issues);
  ReadRequiredString(element, "id", path, record.id, issues);
  ReadRequiredString(element, "file_name", path, record.file_name, issues);

  std::string category;
  ReadRequiredString(element, "category", path, category, issues);
  record.category = documents::ParseCategory(category);

  std::string status;
  ReadRequiredString(element, "status", path, status, issues);
  if (!status.empty() && !documents::ParseStatus(status, record.status)) {
    AddIssue(issues, path + ".status",
             "must be one of not_submitted|pending_review|approved|rejected");
  }

  record.version = 1;
  core::ReadOptionalInteger(element, "version", path, 1, std::numeric_limits<int>::max(),
                            record.version, issues);

  std::string source_path;
  core::ReadOptionalString(element, "path", path, source_path, issues);
  record.source_path = source_path;

  if (const JsonValue* content = core::json::FindMember(element, "content"); content != nullptr) {
    if (content->type == JsonValue::Type::kString) {
      record.content = content->string_value;
    } else {
      AddIssue(issues, path + ".content", "must be a string");
    }
  }

  return issues.size() == issues_before;
}

} // namespace

bool ParseProjectText(std::string_view json_text, Project& project,
                      std::vector<ValidationIssue>& issues, std::string& error) {
  JsonValue root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "invalid project JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(issues, "$", "project must be a JSON object");
    return true;
  }

  core::CheckKnownKeys(root, "$",
                       {"name", "jurisdiction", "facility_address", "permit_number",
                        "contact_email", "contact_phone", "documents"},
                       issues);

  Project parsed;
  ReadRequiredString(root, "name", "$", parsed.info.name, issues);
  core::ReadOptionalString(root, "jurisdiction", "$", parsed.info.jurisdiction, issues);
  core::ReadOptionalString(root, "facility_address", "$", parsed.info.facility_address, issues);
  core::ReadOptionalString(root, "permit_number", "$", parsed.info.permit_number, issues);
  core::ReadOptionalString(root, "contact_email", "$", parsed.info.contact_email, issues);
  core::ReadOptionalString(root, "contact_phone", "$", parsed.info.contact_phone, issues);

  const JsonValue* documents_value = core::json::FindMember(root, "documents");
  if (documents_value == nullptr) {
    AddIssue(issues, "$.documents", "is required");
  } else if (documents_value->type != JsonValue::Type::kArray) {
    AddIssue(issues, "$.documents", "must be an array");
  } else {
    std::set<std::string> seen_ids;
    std::set<std::pair<documents::Category, int>> seen_versions;
    for (std::size_t i = 0; i < documents_value->array_value.size(); ++i) {
      const std::string path = "$.documents[" + std::to_string(i) + "]";
      documents::DocumentRecord record;
      if (!ParseDocument(documents_value->array_value[i], path, record, issues)) {
        continue;
      }
      if (!seen_ids.insert(record.id).second) {
        AddIssue(issues, path + ".id", "duplicate document id '" + record.id + "'");
        continue;
      }
      // Version uniqueness applies per known category only.
      if (record.category != documents::Category::kOther &&
          !seen_versions.insert({record.category, record.version}).second) {
        AddIssue(issues, path + ".version",
                 "duplicate version " + std::to_string(record.version) + " for category " +
                     documents::ToString(record.category));
        continue;
      }
      parsed.documents.push_back(std::move(record));
    }
  }

  project = std::move(parsed);
  return true;
}

bool LoadProjectFile(const std::filesystem::path& project_path, Project& project,
                     std::vector<ValidationIssue>& issues, std::string& error) {
  std::string text;
  if (!core::ReadFileBytes(project_path, text, error)) {
    return false;
  }
  if (!ParseProjectText(text, project, issues, error)) {
    error = project_path.string() + ": " + error;
    return false;
  }
  project.base_dir = project_path.parent_path();
  return true;
}

} // namespace permitpack::project
