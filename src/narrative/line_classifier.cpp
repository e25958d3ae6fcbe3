#include "narrative/line_classifier.hpp"

#include "core/text_utils.hpp"

#include <array>
#include <cctype>

namespace permitpack::narrative {

namespace {

constexpr std::array<std::string_view, 8> kFileExtensions = {
    ".pdf", ".doc", ".docx", ".xls", ".xlsx", ".png", ".jpg", ".jpeg",
};

bool IsDigit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// Length of a "(<digits> copies)" / "(<digits> copy)" group starting at
// `open`, or 0 when the text there is something else. Case-insensitive.
std::size_t MatchCopyCount(std::string_view text, std::size_t open) {
  std::size_t pos = open + 1U;
  const std::size_t digits_begin = pos;
  while (pos < text.size() && IsDigit(text[pos])) {
    ++pos;
  }
  if (pos == digits_begin) {
    return 0;
  }
  while (pos < text.size() && core::IsSpace(text[pos])) {
    ++pos;
  }

  const std::string tail = core::ToLower(text.substr(pos, 7));
  std::size_t word_length = 0;
  if (core::StartsWith(tail, "copies)")) {
    word_length = 6;
  } else if (core::StartsWith(tail, "copy)")) {
    word_length = 4;
  } else {
    return 0;
  }
  return pos + word_length + 1U - open;
}

std::string RemoveCopyCounts(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (text[pos] == '(') {
      const std::size_t length = MatchCopyCount(text, pos);
      if (length > 0U) {
        while (!out.empty() && core::IsSpace(out.back())) {
          out.pop_back();
        }
        pos += length;
        while (pos < text.size() && core::IsSpace(text[pos])) {
          ++pos;
        }
        continue;
      }
    }
    out.push_back(text[pos]);
    ++pos;
  }
  return out;
}

// One pass of marker stripping without the final trim.
std::string StripMarkers(std::string_view raw) {
  std::string text = core::ReplaceAll(raw, "**", "");
  text = core::ReplaceAll(text, "&nbsp;", " ");
  text = core::ReplaceAll(text, "<b>", "");
  text = core::ReplaceAll(text, "</b>", "");
  text = core::ReplaceAll(text, "---", "");
  return RemoveCopyCounts(text);
}

std::string StripMarkersToFixpoint(std::string_view raw) {
  std::string current(raw);
  while (true) {
    std::string next = StripMarkers(current);
    if (next == current) {
      return current;
    }
    current = std::move(next);
  }
}

bool ContainsYearToken(std::string_view text) {
  for (std::size_t i = 0; i + 3U < text.size(); ++i) {
    if (text[i] == '2' && text[i + 1U] == '0' && IsDigit(text[i + 2U]) && IsDigit(text[i + 3U])) {
      return true;
    }
  }
  return false;
}

bool HasOrdinalPrefix(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size() && IsDigit(text[pos])) {
    ++pos;
  }
  if (pos == 0U || pos + 1U >= text.size() || text[pos] != '.') {
    return false;
  }
  return core::IsSpace(text[pos + 1U]);
}

bool MentionsFileExtension(std::string_view text) {
  const std::string lowered = core::ToLower(text);
  for (const std::string_view extension : kFileExtensions) {
    if (core::Contains(lowered, extension)) {
      return true;
    }
  }
  return false;
}

} // namespace

const char* ToString(LineRole role) {
  switch (role) {
  case LineRole::kHeader:
    return "header";
  case LineRole::kDate:
    return "date";
  case LineRole::kSubject:
    return "subject";
  case LineRole::kSalutation:
    return "salutation";
  case LineRole::kCategoryHeading:
    return "category_heading";
  case LineRole::kFilesHeader:
    return "files_header";
  case LineRole::kFileEntry:
    return "file_entry";
  case LineRole::kContactLabelValue:
    return "contact_label_value";
  case LineRole::kClosing:
    return "closing";
  case LineRole::kFooter:
    return "footer";
  case LineRole::kBody:
    return "body";
  }
  return "body";
}

bool ParseLineRole(std::string_view name, LineRole& role) {
  static constexpr std::array<LineRole, 11> kAllRoles = {
      LineRole::kHeader,       LineRole::kDate,        LineRole::kSubject,
      LineRole::kSalutation,   LineRole::kCategoryHeading, LineRole::kFilesHeader,
      LineRole::kFileEntry,    LineRole::kContactLabelValue, LineRole::kClosing,
      LineRole::kFooter,       LineRole::kBody,
  };
  for (const LineRole candidate : kAllRoles) {
    if (name == ToString(candidate)) {
      role = candidate;
      return true;
    }
  }
  return false;
}

std::string NormalizeLine(std::string_view raw) {
  return core::Trim(StripMarkersToFixpoint(raw));
}

bool HasLeadingIndent(std::string_view raw) {
  const std::string stripped = StripMarkersToFixpoint(raw);
  return !stripped.empty() && (stripped.front() == ' ' || stripped.front() == '\t');
}

std::optional<ClassifiedLine> ClassifyLine(std::string_view raw, int raw_index,
                                           const ClassifierProfile& profile) {
  const std::string stripped = StripMarkersToFixpoint(raw);
  std::string text = core::Trim(stripped);
  if (text.empty()) {
    return std::nullopt;
  }

  ClassifiedLine line;
  line.raw_index = raw_index;

  const bool indented = stripped.front() == ' ' || stripped.front() == '\t';
  if (raw_index == 0 && text == profile.letterhead) {
    line.role = LineRole::kHeader;
  } else if (ContainsYearToken(text)) {
    line.role = LineRole::kDate;
  } else if (core::StartsWith(text, "Subject:") || core::StartsWith(text, "RE:")) {
    line.role = LineRole::kSubject;
  } else if (core::StartsWith(text, "Dear ")) {
    line.role = LineRole::kSalutation;
  } else if (HasOrdinalPrefix(text)) {
    line.role = LineRole::kCategoryHeading;
  } else if (text == "Files Submitted:") {
    line.role = LineRole::kFilesHeader;
  } else if (indented && MentionsFileExtension(text)) {
    line.role = LineRole::kFileEntry;
  } else if (core::StartsWith(text, "Email:") || core::StartsWith(text, "Phone:")) {
    line.role = LineRole::kContactLabelValue;
  } else if (text == "Sincerely," ||
             (!profile.signature_phrase.empty() && core::Contains(text, profile.signature_phrase))) {
    line.role = LineRole::kClosing;
  } else if (!profile.footer_prefix.empty() && core::StartsWith(text, profile.footer_prefix)) {
    line.role = LineRole::kFooter;
  } else {
    line.role = LineRole::kBody;
  }

  line.text = std::move(text);
  return line;
}

std::vector<ClassifiedLine> ClassifyLines(const std::vector<std::string>& lines,
                                          const ClassifierProfile& profile,
                                          core::logging::Logger* logger) {
  std::vector<ClassifiedLine> classified;
  classified.reserve(lines.size());

  for (std::size_t i = 0; i < lines.size(); ++i) {
    auto line = ClassifyLine(lines[i], static_cast<int>(i), profile);
    if (!line.has_value()) {
      continue;
    }
    if (logger != nullptr && line->role == LineRole::kBody) {
      logger->Debug("line classified as body by fallback",
                    {{"raw_index", std::to_string(i)}, {"text", line->text}});
    }
    classified.push_back(std::move(*line));
  }
  return classified;
}

} // namespace permitpack::narrative
