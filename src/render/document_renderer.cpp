#include "render/document_renderer.hpp"

#include "core/text_utils.hpp"

namespace permitpack::render {

namespace {

using narrative::ClassifiedLine;
using narrative::LineRole;

constexpr const char* kIndentPrefix = "    ";

TextRun MakeRun(const RoleStyle& style, std::string text, bool bold) {
  TextRun run;
  run.text = std::move(text);
  run.bold = bold;
  run.italic = style.italic;
  run.size_pt = style.size_pt;
  run.font = style.font;
  run.color = style.color;
  return run;
}

RenderedParagraph MakeSpacer() {
  RenderedParagraph spacer;
  spacer.runs.push_back(TextRun{});
  return spacer;
}

RenderedParagraph RenderLine(const ClassifiedLine& line,
                             const narrative::ClassifierProfile& profile) {
  const RoleStyle style = StyleForRole(line.role);

  RenderedParagraph paragraph;
  paragraph.alignment = style.alignment;
  paragraph.indent_left_pt = style.indent_left_pt;

  switch (line.role) {
  case LineRole::kContactLabelValue: {
    // "Email: permits@example.com" -> bold "Email:" + plain " permits@..."
    const std::size_t colon = line.text.find(':');
    if (colon == std::string::npos) {
      paragraph.runs.push_back(MakeRun(style, line.text, false));
      break;
    }
    paragraph.runs.push_back(MakeRun(style, line.text.substr(0, colon + 1U), true));
    paragraph.runs.push_back(MakeRun(style, line.text.substr(colon + 1U), false));
    break;
  }
  case LineRole::kClosing: {
    const bool signature = !profile.signature_phrase.empty() &&
                           core::Contains(line.text, profile.signature_phrase);
    paragraph.runs.push_back(MakeRun(style, line.text, signature));
    break;
  }
  default:
    paragraph.runs.push_back(MakeRun(style, line.text, style.bold));
    break;
  }

  return paragraph;
}

} // namespace

const char* ToString(Alignment alignment) {
  switch (alignment) {
  case Alignment::kLeft:
    return "left";
  case Alignment::kCenter:
    return "center";
  case Alignment::kRight:
    return "right";
  }
  return "left";
}

RoleStyle StyleForRole(LineRole role) {
  RoleStyle style;
  switch (role) {
  case LineRole::kHeader:
    style.size_pt = 14;
    style.bold = true;
    style.alignment = Alignment::kCenter;
    break;
  case LineRole::kDate:
    style.alignment = Alignment::kRight;
    break;
  case LineRole::kSubject:
    style.bold = true;
    break;
  case LineRole::kSalutation:
    break;
  case LineRole::kCategoryHeading:
    style.font = kTimesNewRoman;
    style.bold = true;
    break;
  case LineRole::kFilesHeader:
    style.font = kTimesNewRoman;
    break;
  case LineRole::kFileEntry:
    style.size_pt = 10;
    style.font = kTimesNewRoman;
    style.indent_left_pt = 9;
    break;
  case LineRole::kContactLabelValue:
  case LineRole::kClosing:
    break;
  case LineRole::kFooter:
    style.size_pt = 9;
    style.italic = true;
    style.alignment = Alignment::kCenter;
    style.color = kFooterColor;
    break;
  case LineRole::kBody:
  default:
    style.font = kTimesNewRoman;
    break;
  }
  return style;
}

std::vector<RenderedParagraph> RenderLines(const std::vector<ClassifiedLine>& lines,
                                           const narrative::ClassifierProfile& profile) {
  std::vector<RenderedParagraph> paragraphs;
  paragraphs.reserve(lines.size());

  int next_index = 0;
  for (const auto& line : lines) {
    for (; next_index < line.raw_index; ++next_index) {
      paragraphs.push_back(MakeSpacer());
    }
    paragraphs.push_back(RenderLine(line, profile));
    next_index = line.raw_index + 1;
  }
  return paragraphs;
}

std::vector<std::string> PlainTextOf(const std::vector<RenderedParagraph>& paragraphs) {
  std::vector<std::string> lines;
  lines.reserve(paragraphs.size());
  for (const auto& paragraph : paragraphs) {
    std::string text;
    for (const auto& run : paragraph.runs) {
      text += run.text;
    }
    if (paragraph.indent_left_pt > 0 && !text.empty()) {
      text.insert(0, kIndentPrefix);
    }
    lines.push_back(std::move(text));
  }
  return lines;
}

bool IsSpacer(const RenderedParagraph& paragraph) {
  for (const auto& run : paragraph.runs) {
    if (!run.text.empty()) {
      return false;
    }
  }
  return true;
}

} // namespace permitpack::render
