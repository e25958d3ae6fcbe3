#ifndef PERMITPACK_CORE_TEXT_UTILS_HPP_
#define PERMITPACK_CORE_TEXT_UTILS_HPP_

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::core {

inline bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string_view TrimView(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && IsSpace(text[begin])) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && IsSpace(text[end - 1U])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

inline std::string Trim(std::string_view text) {
  return std::string(TrimView(text));
}

inline bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

inline bool Contains(std::string_view text, std::string_view needle) {
  return text.find(needle) != std::string_view::npos;
}

inline std::string ToLower(std::string_view text) {
  std::string lowered(text);
  for (char& c : lowered) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return lowered;
}

// Replaces every occurrence of `needle`; an empty needle leaves text as is.
inline std::string ReplaceAll(std::string_view text, std::string_view needle,
                              std::string_view replacement) {
  if (needle.empty()) {
    return std::string(text);
  }
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (true) {
    const std::size_t hit = text.find(needle, pos);
    if (hit == std::string_view::npos) {
      out.append(text.substr(pos));
      return out;
    }
    out.append(text.substr(pos, hit - pos));
    out.append(replacement);
    pos = hit + needle.size();
  }
}

// Splits on '\n' and drops a trailing '\r' from each line, so CRLF
// narratives classify the same as LF ones.
inline std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t newline = text.find('\n', pos);
    std::string_view line =
        newline == std::string_view::npos ? text.substr(pos) : text.substr(pos, newline - pos);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    if (newline == std::string_view::npos) {
      break;
    }
    pos = newline + 1U;
  }
  return lines;
}

inline std::string JoinLines(const std::vector<std::string>& lines) {
  std::string joined;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i != 0U) {
      joined.push_back('\n');
    }
    joined.append(lines[i]);
  }
  return joined;
}

} // namespace permitpack::core

#endif // PERMITPACK_CORE_TEXT_UTILS_HPP_
