#include "narrative/structured_narrative.hpp"

#include "core/json_dom.hpp"

namespace permitpack::narrative {

bool ParseStructuredNarrative(std::string_view json_text, std::vector<ClassifiedLine>& lines,
                              std::vector<std::string>& unknown_roles, std::string& error) {
  core::json::Value root;
  if (!core::json::Parse(json_text, root, error)) {
    error = "structured narrative is not valid JSON: " + error;
    return false;
  }
  if (root.type != core::json::Value::Type::kArray) {
    error = "structured narrative must be a JSON array of {role, text} objects";
    return false;
  }

  std::vector<ClassifiedLine> parsed;
  std::vector<std::string> unknown;
  for (std::size_t i = 0; i < root.array_value.size(); ++i) {
    const auto& element = root.array_value[i];
    const std::string where = "narrative[" + std::to_string(i) + "]";
    if (element.type != core::json::Value::Type::kObject) {
      error = where + " must be an object";
      return false;
    }
    const auto text = core::json::ReadString(element, "text");
    if (!text.has_value()) {
      error = where + ".text must be a string";
      return false;
    }

    ClassifiedLine line;
    line.raw_index = static_cast<int>(i);
    line.text = NormalizeLine(*text);
    if (line.text.empty()) {
      continue;
    }

    const auto role_name = core::json::ReadString(element, "role");
    if (!role_name.has_value() || !ParseLineRole(*role_name, line.role)) {
      line.role = LineRole::kBody;
      unknown.push_back(role_name.value_or(""));
    }
    parsed.push_back(std::move(line));
  }

  lines = std::move(parsed);
  unknown_roles = std::move(unknown);
  return true;
}

} // namespace permitpack::narrative
