#include "archive/archive_backend.hpp"

namespace permitpack::archive {

const char* ToString(PersistKind kind) {
  switch (kind) {
  case PersistKind::kSaved:
    return "saved";
  case PersistKind::kCancelled:
    return "cancelled";
  case PersistKind::kFellBackTo:
    return "fell_back_to";
  case PersistKind::kFailed:
    return "failed";
  }
  return "failed";
}

ArchiveBackend::ArchiveBackend(INotifier* notifier, core::logging::Logger* logger)
    : notifier_(notifier), logger_(logger) {}

void ArchiveBackend::AddStrategy(std::unique_ptr<IPersistStrategy> strategy) {
  if (strategy != nullptr) {
    strategies_.push_back(std::move(strategy));
  }
}

PersistResult ArchiveBackend::PersistPackage(const package::PackageManifest& manifest,
                                             const std::string& suggested_name) {
  PersistResult result;
  std::string last_detail;

  for (std::size_t i = 0; i < strategies_.size(); ++i) {
    IPersistStrategy& strategy = *strategies_[i];
    const AttemptOutcome outcome = strategy.Attempt(manifest, suggested_name);

    switch (outcome.status) {
    case AttemptStatus::kSaved:
      result.kind = i == 0U ? PersistKind::kSaved : PersistKind::kFellBackTo;
      result.method = strategy.Name();
      result.location = outcome.location;
      if (logger_ != nullptr) {
        logger_->Info("package persisted", {{"method", result.method},
                                            {"location", result.location.string()}});
        if (!outcome.detail.empty()) {
          logger_->Warn(outcome.detail, {{"method", result.method}});
        }
      }
      NotifySaved(manifest, result.location);
      return result;

    case AttemptStatus::kCancelled:
      result.kind = PersistKind::kCancelled;
      result.method = strategy.Name();
      if (logger_ != nullptr) {
        logger_->Info("export cancelled", {{"method", result.method}});
      }
      return result;

    case AttemptStatus::kFatalFailure:
      result.kind = PersistKind::kFailed;
      result.method = strategy.Name();
      result.error = outcome.detail;
      if (logger_ != nullptr) {
        logger_->Error("package assembly failed",
                       {{"method", result.method}, {"error", outcome.detail}});
      }
      return result;

    case AttemptStatus::kUnavailable:
    case AttemptStatus::kRecoverableFailure:
      if (logger_ != nullptr) {
        const auto level = outcome.status == AttemptStatus::kUnavailable
                               ? core::logging::LogLevel::kDebug
                               : core::logging::LogLevel::kWarn;
        logger_->Log(level, "persist strategy skipped",
                     {{"method", strategy.Name()},
                      {"status", ToString(outcome.status)},
                      {"detail", outcome.detail}});
      }
      if (outcome.status == AttemptStatus::kRecoverableFailure || last_detail.empty()) {
        last_detail = std::string(strategy.Name()) + ": " + outcome.detail;
      }
      break;
    }
  }

  result.kind = PersistKind::kFailed;
  result.error = strategies_.empty() ? "no persist strategy configured"
                                     : "no persist strategy succeeded (" + last_detail +
                                           "); retry or download documents individually";
  if (logger_ != nullptr) {
    logger_->Error("package could not be persisted", {{"error", result.error}});
  }
  return result;
}

void ArchiveBackend::NotifySaved(const package::PackageManifest& manifest,
                                 const std::filesystem::path& location) {
  if (notifier_ == nullptr) {
    return;
  }
  Notification notification;
  notification.title = "Export Complete";
  notification.artifact_name = location.filename().string();
  notification.detail = "Saved to " + location.parent_path().string();
  notification.entry_count = manifest.entries.size();
  notifier_->Notify(notification);
}

} // namespace permitpack::archive
