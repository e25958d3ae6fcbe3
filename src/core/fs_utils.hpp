#ifndef PERMITPACK_CORE_FS_UTILS_HPP_
#define PERMITPACK_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace permitpack::core {

namespace detail {

inline std::filesystem::path BuildStagingPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Moves a fully written staging file onto its final name. An existing
// regular file at the destination is replaced; an existing directory is
// never touched and the publish fails. The staging file is removed when
// publishing fails so no partial output survives.
inline bool PublishStagedFile(const std::filesystem::path& staged_path,
                              const std::filesystem::path& output_path, std::string& error) {
  std::error_code ec;
  if (std::filesystem::is_directory(output_path, ec)) {
    (void)std::filesystem::remove(staged_path, ec);
    error = "output path '" + output_path.string() + "' is an existing directory";
    return false;
  }

  std::error_code rename_ec;
  std::filesystem::rename(staged_path, output_path, rename_ec);
  if (rename_ec) {
    std::error_code remove_ec;
    (void)std::filesystem::remove(output_path, remove_ec);
    rename_ec.clear();
    std::filesystem::rename(staged_path, output_path, rename_ec);
  }
  if (rename_ec) {
    std::error_code cleanup_ec;
    (void)std::filesystem::remove(staged_path, cleanup_ec);
    error = "failed to publish output '" + output_path.string() + "': " + rename_ec.message();
    return false;
  }
  return true;
}

// Moves a staging directory built by the caller onto `output_path`, which
// must not exist yet. Only the staging directory is ever removed on failure.
inline bool PublishStagedDirectory(const std::filesystem::path& staged_dir,
                                   const std::filesystem::path& output_path,
                                   std::string& error) {
  std::error_code ec;
  const bool occupied = std::filesystem::exists(output_path, ec);
  if (!occupied && !ec) {
    std::filesystem::rename(staged_dir, output_path, ec);
    if (!ec) {
      return true;
    }
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove_all(staged_dir, cleanup_ec);
  error = occupied ? "output path '" + output_path.string() + "' already exists"
                   : "failed to publish output '" + output_path.string() + "': " + ec.message();
  return false;
}

// First of `base`, `base (2)`, `base (3)`... that does not exist yet.
inline std::filesystem::path FirstFreePath(const std::filesystem::path& base) {
  std::error_code ec;
  if (!std::filesystem::exists(base, ec)) {
    return base;
  }
  for (int n = 2;; ++n) {
    std::filesystem::path candidate = base;
    candidate += " (" + std::to_string(n) + ")";
    if (!std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
}

// Writes the whole payload to a sibling staging file, then renames it into
// place. Readers never observe a half-written archive or cover letter.
inline bool WriteFileAtomic(const std::filesystem::path& output_path, std::string_view bytes,
                            std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }
  std::error_code dir_ec;
  if (std::filesystem::is_directory(output_path, dir_ec)) {
    error = "output path '" + output_path.string() + "' is an existing directory";
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildStagingPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_file) {
      out_file.close();
      std::error_code cleanup_ec;
      (void)std::filesystem::remove(temp_path, cleanup_ec);
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  return PublishStagedFile(temp_path, output_path, error);
}

inline bool ReadFileBytes(const std::filesystem::path& input_path, std::string& bytes,
                          std::string& error) {
  std::ifstream in_file(input_path, std::ios::binary);
  if (!in_file) {
    error = "unable to open file: " + input_path.string();
    return false;
  }
  bytes.assign(std::istreambuf_iterator<char>(in_file), std::istreambuf_iterator<char>());
  if (in_file.bad()) {
    error = "failed while reading file: " + input_path.string();
    return false;
  }
  return true;
}

} // namespace permitpack::core

#endif // PERMITPACK_CORE_FS_UTILS_HPP_
