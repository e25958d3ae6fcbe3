#pragma once

#include "narrative/line_classifier.hpp"

#include <string>
#include <vector>

namespace permitpack::render {

inline constexpr const char* kTimesNewRoman = "Times New Roman";
inline constexpr const char* kFooterColor = "666666";

enum class Alignment {
  kLeft,
  kCenter,
  kRight,
};

// Font and color left empty mean "document default".
struct TextRun {
  std::string text;
  bool bold = false;
  bool italic = false;
  int size_pt = 11;
  std::string font;
  std::string color;
};

struct RenderedParagraph {
  std::vector<TextRun> runs;
  Alignment alignment = Alignment::kLeft;
  int indent_left_pt = 0;
};

// Typography for one role. `bold` is the paragraph default; contact lines
// and closings override it per run.
struct RoleStyle {
  int size_pt = 11;
  const char* font = "";
  bool bold = false;
  bool italic = false;
  Alignment alignment = Alignment::kLeft;
  int indent_left_pt = 0;
  const char* color = "";
};

const char* ToString(Alignment alignment);

// Fixed role -> style table. Every file entry resolves to 10pt Times New
// Roman with a 9pt (0.125in) left indent, whatever category it sits under.
RoleStyle StyleForRole(narrative::LineRole role);

// One paragraph per classified line, in order. Every raw line index skipped
// by the classifier (blank input) becomes a spacer paragraph holding one
// empty run, so paragraph i always corresponds to narrative line i.
std::vector<RenderedParagraph> RenderLines(const std::vector<narrative::ClassifiedLine>& lines,
                                           const narrative::ClassifierProfile& profile = {});

// Text projection of rendered paragraphs: runs concatenated, spacers as
// empty lines, indented paragraphs prefixed with four spaces. Classifying
// this projection reproduces the original role sequence.
std::vector<std::string> PlainTextOf(const std::vector<RenderedParagraph>& paragraphs);

bool IsSpacer(const RenderedParagraph& paragraph);

} // namespace permitpack::render
