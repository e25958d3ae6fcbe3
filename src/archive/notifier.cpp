#include "archive/notifier.hpp"

#include <ostream>

namespace permitpack::archive {

ConsoleNotifier::ConsoleNotifier(std::ostream& out) : out_(&out) {}

void ConsoleNotifier::Notify(const Notification& notification) {
  (*out_) << notification.title << ": " << notification.artifact_name << '\n'
          << "  " << notification.entry_count << " files";
  if (!notification.detail.empty()) {
    (*out_) << ", " << notification.detail;
  }
  (*out_) << '\n';
  out_->flush();
}

} // namespace permitpack::archive
