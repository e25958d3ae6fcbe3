#include "archive/pickers.hpp"

#include "core/text_utils.hpp"

#include <istream>
#include <ostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace permitpack::archive {

namespace {

// Reads one trimmed answer line. nullopt on end of input.
std::optional<std::string> ReadAnswer(std::istream& in) {
  std::string line;
  if (!std::getline(in, line)) {
    return std::nullopt;
  }
  return core::Trim(line);
}

} // namespace

PresetSaveTargetPicker::PresetSaveTargetPicker(fs::path target) : target_(std::move(target)) {}

PickResult PresetSaveTargetPicker::PickSaveTarget(const std::string& suggested_name) {
  PickResult result;
  if (target_.empty()) {
    result.status = PickStatus::kFailed;
    result.error = "no save target configured";
    return result;
  }
  std::error_code ec;
  result.status = PickStatus::kPicked;
  result.path = fs::is_directory(target_, ec) ? target_ / suggested_name : target_;
  return result;
}

PresetDirectoryPicker::PresetDirectoryPicker(fs::path directory)
    : directory_(std::move(directory)) {}

PickResult PresetDirectoryPicker::PickDirectory(const std::optional<fs::path>& /*start_dir*/) {
  PickResult result;
  if (directory_.empty()) {
    result.status = PickStatus::kFailed;
    result.error = "no output directory configured";
    return result;
  }
  result.status = PickStatus::kPicked;
  result.path = directory_;
  return result;
}

PromptSaveTargetPicker::PromptSaveTargetPicker(std::istream& in, std::ostream& out)
    : in_(&in), out_(&out) {}

PickResult PromptSaveTargetPicker::PickSaveTarget(const std::string& suggested_name) {
  (*out_) << "Save package as ('.' for " << suggested_name << ", empty to cancel): ";
  out_->flush();

  PickResult result;
  const auto answer = ReadAnswer(*in_);
  if (!answer.has_value() || answer->empty()) {
    result.status = PickStatus::kCancelled;
    return result;
  }
  // An existing folder means "save into it", never "replace it".
  std::error_code ec;
  const fs::path answered = *answer == "." ? fs::path(suggested_name) : fs::path(*answer);
  result.status = PickStatus::kPicked;
  result.path = fs::is_directory(answered, ec) ? answered / suggested_name : answered;
  return result;
}

PromptDirectoryPicker::PromptDirectoryPicker(std::istream& in, std::ostream& out)
    : in_(&in), out_(&out) {}

PickResult PromptDirectoryPicker::PickDirectory(const std::optional<fs::path>& start_dir) {
  (*out_) << "Folder for package files";
  if (start_dir.has_value()) {
    (*out_) << " ('.' for " << start_dir->string() << ")";
  }
  (*out_) << ", empty to cancel: ";
  out_->flush();

  PickResult result;
  const auto answer = ReadAnswer(*in_);
  if (!answer.has_value() || answer->empty()) {
    result.status = PickStatus::kCancelled;
    return result;
  }
  if (*answer == "." && start_dir.has_value()) {
    result.status = PickStatus::kPicked;
    result.path = *start_dir;
    return result;
  }
  result.status = PickStatus::kPicked;
  result.path = fs::path(*answer);
  return result;
}

} // namespace permitpack::archive
