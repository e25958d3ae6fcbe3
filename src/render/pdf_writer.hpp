#pragma once

#include "render/document_renderer.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::render {

// US Letter in points with the same 1 inch margins as the docx output.
inline constexpr float kPdfPageWidthPt = 612.0F;
inline constexpr float kPdfPageHeightPt = 792.0F;
inline constexpr float kPdfMarginPt = 72.0F;
inline constexpr float kPdfLineHeightFactor = 1.2F;
inline constexpr float kPdfParagraphGapPt = 4.0F;

struct PdfMetadata {
  std::string title = "High-Piled Storage Permit Cover Letter";
  std::string author;
  std::string subject = "Permit Application Cover Letter";
  std::string keywords = "permit, high-piled storage, application";
};

// A stretch of same-styled text at a fixed position. `text` is already in
// WinAnsi bytes and `font_name` is one of the standard 14 PDF fonts.
struct PlacedText {
  std::string text;
  std::string font_name;
  int size_pt = 11;
  std::string color;
  float x = 0.0F;
};

struct PdfLine {
  int page = 0;
  float baseline_y = 0.0F;
  std::vector<PlacedText> pieces;
};

// Width in points of `text` set in `font_name` at `size_pt`.
using PdfTextMeasure =
    std::function<float(std::string_view text, const std::string& font_name, int size_pt)>;

// Maps a run onto the standard fonts: Times New Roman runs use the Times
// family, everything else Helvetica, with bold/italic variants.
std::string StandardFontFor(const TextRun& run);

// UTF-8 to Windows-1252. Code points the encoding lacks become '?'.
std::string ToWinAnsi(std::string_view utf8);

// Word-wraps paragraphs into positioned lines, top to bottom, starting a new
// page when the next line would cross the bottom margin. Alignment and left
// indent come from each paragraph; spacers advance half a line.
std::vector<PdfLine> LayoutPdfLines(const std::vector<RenderedParagraph>& paragraphs,
                                    const PdfTextMeasure& measure);

// Serializes paragraphs as a PDF through libharu. Page streams are
// deflated when `compress` is set.
bool WriteCoverLetterPdf(const std::vector<RenderedParagraph>& paragraphs,
                         const PdfMetadata& metadata, bool compress, std::string& pdf_bytes,
                         std::string& error);

} // namespace permitpack::render
