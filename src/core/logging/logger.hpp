#pragma once

#include <array>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/text_utils.hpp"
#include "core/time_utils.hpp"

namespace permitpack::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

namespace detail {

struct LevelName {
  std::string_view cli_name;
  std::string_view line_name;
  LogLevel level;
};

inline constexpr std::array<LevelName, 4> kLevelNames = {{
    {"debug", "DEBUG", LogLevel::kDebug},
    {"info", "INFO", LogLevel::kInfo},
    {"warn", "WARN", LogLevel::kWarn},
    {"error", "ERROR", LogLevel::kError},
}};

inline void AppendQuoted(std::string& line, std::string_view raw) {
  line.push_back('"');
  for (const char c : raw) {
    switch (c) {
    case '\\':
      line += "\\\\";
      break;
    case '"':
      line += "\\\"";
      break;
    case '\n':
      line += "\\n";
      break;
    case '\r':
      line += "\\r";
      break;
    case '\t':
      line += "\\t";
      break;
    default:
      line.push_back(c);
      break;
    }
  }
  line.push_back('"');
}

} // namespace detail

inline std::string_view ToString(LogLevel level) {
  for (const auto& entry : detail::kLevelNames) {
    if (entry.level == level) {
      return entry.line_name;
    }
  }
  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  std::string joined;
  for (const auto& entry : detail::kLevelNames) {
    if (!joined.empty()) {
      joined.push_back('|');
    }
    joined.append(entry.cli_name);
  }
  return joined;
}

// Accepts the names in ExpectedLogLevelList() in any case, plus "warning".
inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();
  const std::string normalized = ToLower(TrimView(raw));
  if (normalized.empty()) {
    error = "missing log level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }
  if (normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  for (const auto& entry : detail::kLevelNames) {
    if (normalized == entry.cli_name) {
      level = entry.level;
      return true;
    }
  }
  error = "invalid log level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() + ")";
  return false;
}

// Line-oriented key=value logger shared by the CLI and library modules.
//
// Every line starts with `ts_utc`, `level`, `export_id` and `msg`, followed by
// context fields set once per export request and then per-call fields.
// Lines are assembled first and written under a lock, so output from fetch
// workers never interleaves.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetMinLevel(LogLevel level) {
    min_level_ = level;
  }

  LogLevel MinLevel() const {
    return min_level_;
  }

  void SetExportId(std::string export_id) {
    export_id_ = std::move(export_id);
  }

  const std::string& ExportId() const {
    return export_id_;
  }

  // Adds or replaces a context field emitted on every subsequent line.
  void SetContext(std::string key, std::string value) {
    for (auto& field : context_) {
      if (field.first == key) {
        field.second = std::move(value);
        return;
      }
    }
    context_.emplace_back(std::move(key), std::move(value));
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line = "ts_utc=" + FormatUtcMillis(std::chrono::system_clock::now());
    line += " level=";
    line.append(ToString(level));
    line += " export_id=";
    detail::AppendQuoted(line, export_id_);
    line += " msg=";
    detail::AppendQuoted(line, message);
    for (const auto& [key, value] : context_) {
      AppendField(line, key, value);
    }
    for (const auto& field : fields) {
      AppendField(line, field.key, field.value);
    }
    line.push_back('\n');

    const std::lock_guard<std::mutex> lock(write_mutex_);
    (*out_) << line;
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static void AppendField(std::string& line, std::string_view key, std::string_view value) {
    line.push_back(' ');
    line.append(key);
    line.push_back('=');
    detail::AppendQuoted(line, value);
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::mutex write_mutex_;
  std::string export_id_ = "-";
  std::vector<std::pair<std::string, std::string>> context_;
};

} // namespace permitpack::core::logging
