#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace permitpack::archive {

// Key under which the directory-write strategy remembers the last folder.
inline constexpr const char* kLastDownloadPathKey = "lastDownloadPath";

// Small string key/value capability injected into persist strategies.
class IPreferenceStore {
public:
  virtual ~IPreferenceStore() = default;

  virtual std::optional<std::string> Get(std::string_view key) const = 0;

  virtual bool Set(std::string_view key, std::string_view value, std::string& error) = 0;
};

class InMemoryPreferenceStore final : public IPreferenceStore {
public:
  std::optional<std::string> Get(std::string_view key) const override;
  bool Set(std::string_view key, std::string_view value, std::string& error) override;

private:
  std::map<std::string, std::string, std::less<>> values_;
};

// Flat JSON object of string values persisted at `path`.
//
// Contract:
// - Load() on a missing file yields an empty store; a malformed file or a
//   non-string value is an error.
// - every Set() rewrites the whole file atomically.
class JsonFilePreferenceStore final : public IPreferenceStore {
public:
  explicit JsonFilePreferenceStore(std::filesystem::path path);

  bool Load(std::string& error);

  std::optional<std::string> Get(std::string_view key) const override;
  bool Set(std::string_view key, std::string_view value, std::string& error) override;

  const std::filesystem::path& Path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
  std::map<std::string, std::string, std::less<>> values_;
};

} // namespace permitpack::archive
