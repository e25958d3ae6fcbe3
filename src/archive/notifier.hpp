#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace permitpack::archive {

inline constexpr std::chrono::seconds kNotificationTtl{5};

// Success toast shown after a package is persisted.
struct Notification {
  std::string title;
  std::string artifact_name;
  // Where the artifact went, e.g. "Saved to /home/me/Downloads".
  std::string detail;
  std::size_t entry_count = 0;
  std::chrono::seconds ttl = kNotificationTtl;
};

class INotifier {
public:
  virtual ~INotifier() = default;

  virtual void Notify(const Notification& notification) = 0;
};

// Terminal rendition: one block on the given stream. Printed lines are never
// dismissed, so the ttl is not used here.
class ConsoleNotifier final : public INotifier {
public:
  explicit ConsoleNotifier(std::ostream& out);

  void Notify(const Notification& notification) override;

private:
  std::ostream* out_ = nullptr;
};

} // namespace permitpack::archive
