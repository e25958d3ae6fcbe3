#ifndef PERMITPACK_CORE_TIME_UTILS_HPP_
#define PERMITPACK_CORE_TIME_UTILS_HPP_

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace permitpack::core {

namespace detail {

inline bool ToCalendarTime(std::chrono::system_clock::time_point timestamp, bool utc,
                           std::tm& calendar) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
#if defined(_WIN32)
  const errno_t result =
      utc ? gmtime_s(&calendar, &epoch_seconds) : localtime_s(&calendar, &epoch_seconds);
  return result == 0;
#else
  const std::tm* result =
      utc ? gmtime_r(&epoch_seconds, &calendar) : localtime_r(&epoch_seconds, &calendar);
  return result != nullptr;
#endif
}

} // namespace detail

// US long date used on cover letters, e.g. "October 19, 2026".
// Month names are spelled out here so the output does not depend on the
// process locale.
inline std::string FormatLetterDate(std::chrono::system_clock::time_point timestamp) {
  static constexpr std::array<const char*, 12> kMonths = {
      "January", "February", "March",     "April",   "May",      "June",
      "July",    "August",   "September", "October", "November", "December",
  };

  std::tm local_time{};
  if (!detail::ToCalendarTime(timestamp, /*utc=*/false, local_time)) {
    return "";
  }
  if (local_time.tm_mon < 0 || local_time.tm_mon > 11) {
    return "";
  }

  std::ostringstream out;
  out << kMonths[static_cast<std::size_t>(local_time.tm_mon)] << ' ' << local_time.tm_mday
      << ", " << (local_time.tm_year + 1900);
  return out.str();
}

// ISO-8601 UTC with millisecond precision, e.g. `2026-10-19T18:54:00.123Z`.
inline std::string FormatUtcMillis(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::ToCalendarTime(timestamp, /*utc=*/true, utc_time)) {
    return "";
  }
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis_component << 'Z';
  return out.str();
}

// Export ids look like `export-20261019T185400Z-123` (UTC, millis suffix).
inline std::string MakeExportId(std::chrono::system_clock::time_point timestamp) {
  std::tm utc_time{};
  if (!detail::ToCalendarTime(timestamp, /*utc=*/true, utc_time)) {
    return "export-unknown";
  }
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  std::ostringstream out;
  out << "export-" << std::put_time(&utc_time, "%Y%m%dT%H%M%S") << "Z-" << std::setw(3)
      << std::setfill('0') << millis_component;
  return out.str();
}

} // namespace permitpack::core

#endif // PERMITPACK_CORE_TIME_UTILS_HPP_
