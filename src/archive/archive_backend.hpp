#pragma once

#include "archive/notifier.hpp"
#include "archive/persist_strategy.hpp"
#include "core/logging/logger.hpp"
#include "package/package_assembler.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace permitpack::archive {

enum class PersistKind {
  kSaved,
  kCancelled,
  kFellBackTo,
  kFailed,
};

const char* ToString(PersistKind kind);

struct PersistResult {
  PersistKind kind = PersistKind::kFailed;
  // Strategy that produced the result; empty for kFailed/kCancelled before
  // any strategy ran.
  std::string method;
  std::filesystem::path location;
  std::string error;
};

// Capability chain that persists one manifest.
//
// Contract:
// - strategies run in registration order; the first kSaved wins. It is
//   reported as kSaved when it is the first strategy, kFellBackTo otherwise.
// - kCancelled and kFatalFailure stop the chain immediately.
// - kUnavailable and kRecoverableFailure are logged and the next strategy
//   runs. If none is left the result is kFailed.
// - every success sends exactly one notification.
class ArchiveBackend {
public:
  ArchiveBackend(INotifier* notifier, core::logging::Logger* logger);

  void AddStrategy(std::unique_ptr<IPersistStrategy> strategy);

  std::size_t StrategyCount() const {
    return strategies_.size();
  }

  PersistResult PersistPackage(const package::PackageManifest& manifest,
                               const std::string& suggested_name);

private:
  void NotifySaved(const package::PackageManifest& manifest,
                   const std::filesystem::path& location);

  INotifier* notifier_ = nullptr;
  core::logging::Logger* logger_ = nullptr;
  std::vector<std::unique_ptr<IPersistStrategy>> strategies_;
};

} // namespace permitpack::archive
