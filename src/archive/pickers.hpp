#pragma once

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>

namespace permitpack::archive {

enum class PickStatus {
  kPicked,
  kCancelled,
  // The capability exists but failed (e.g. dialog crashed, bad input).
  kFailed,
};

struct PickResult {
  PickStatus status = PickStatus::kCancelled;
  std::filesystem::path path;
  std::string error;
};

// Chooses the exact path an archive is saved to.
class ISaveTargetPicker {
public:
  virtual ~ISaveTargetPicker() = default;

  virtual PickResult PickSaveTarget(const std::string& suggested_name) = 0;
};

// Chooses a folder that receives the package entries as loose files.
// `start_dir` is the last folder used, when known.
class IDirectoryPicker {
public:
  virtual ~IDirectoryPicker() = default;

  virtual PickResult PickDirectory(const std::optional<std::filesystem::path>& start_dir) = 0;
};

// Non-interactive pickers: always answer with the path given up front. A
// preset save target that names an existing directory receives the
// suggested file name inside it.
class PresetSaveTargetPicker final : public ISaveTargetPicker {
public:
  explicit PresetSaveTargetPicker(std::filesystem::path target);

  PickResult PickSaveTarget(const std::string& suggested_name) override;

private:
  std::filesystem::path target_;
};

class PresetDirectoryPicker final : public IDirectoryPicker {
public:
  explicit PresetDirectoryPicker(std::filesystem::path directory);

  PickResult PickDirectory(const std::optional<std::filesystem::path>& start_dir) override;

private:
  std::filesystem::path directory_;
};

// Line-prompt pickers for interactive terminals. An empty answer (or end of
// input) cancels; the suggestion or start directory is offered as default
// with a single "." answer. A save answer naming an existing directory
// saves the suggested file name inside it.
class PromptSaveTargetPicker final : public ISaveTargetPicker {
public:
  PromptSaveTargetPicker(std::istream& in, std::ostream& out);

  PickResult PickSaveTarget(const std::string& suggested_name) override;

private:
  std::istream* in_ = nullptr;
  std::ostream* out_ = nullptr;
};

class PromptDirectoryPicker final : public IDirectoryPicker {
public:
  PromptDirectoryPicker(std::istream& in, std::ostream& out);

  PickResult PickDirectory(const std::optional<std::filesystem::path>& start_dir) override;

private:
  std::istream* in_ = nullptr;
  std::ostream* out_ = nullptr;
};

} // namespace permitpack::archive
