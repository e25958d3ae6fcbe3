#include "render/pdf_writer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

using permitpack::render::Alignment;
using permitpack::render::LayoutPdfLines;
using permitpack::render::PdfLine;
using permitpack::render::PdfTextMeasure;
using permitpack::render::RenderedParagraph;
using permitpack::render::TextRun;

namespace {

// Every byte is half an em wide, so a 10pt character is 5pt.
const PdfTextMeasure kFixedWidth = [](std::string_view text, const std::string&, int size_pt) {
  return static_cast<float>(text.size()) * static_cast<float>(size_pt) * 0.5F;
};

TextRun Run(std::string text, int size_pt = 10, bool bold = false) {
  TextRun run;
  run.text = std::move(text);
  run.size_pt = size_pt;
  run.bold = bold;
  return run;
}

RenderedParagraph Paragraph(std::vector<TextRun> runs, Alignment alignment = Alignment::kLeft,
                            int indent_left_pt = 0) {
  RenderedParagraph paragraph;
  paragraph.runs = std::move(runs);
  paragraph.alignment = alignment;
  paragraph.indent_left_pt = indent_left_pt;
  return paragraph;
}

} // namespace

TEST_CASE("Long paragraphs wrap at the text width", "[render][pdf]") {
  std::string text;
  for (int i = 0; i < 30; ++i) {
    text += i == 0 ? "abcdefghi" : " abcdefghi";
  }
  const std::vector<PdfLine> lines = LayoutPdfLines({Paragraph({Run(text)})}, kFixedWidth);

  // 45pt words with 5pt spaces: nine fit in 468pt.
  REQUIRE(lines.size() == 4);
  REQUIRE(lines[0].pieces.size() == 1);
  REQUIRE(lines[0].pieces[0].x == 72.0F);
  REQUIRE(lines[0].pieces[0].text.size() == 9U * 9U + 8U);
  REQUIRE(lines[3].pieces[0].text == "abcdefghi abcdefghi abcdefghi");
  REQUIRE(lines[0].baseline_y == 710.0F);
  REQUIRE(lines[1].baseline_y == 698.0F);
  for (const auto& line : lines) {
    REQUIRE(line.page == 0);
  }
}

TEST_CASE("Alignment and indent position the line", "[render][pdf]") {
  const std::vector<PdfLine> lines = LayoutPdfLines(
      {
          Paragraph({Run("Hi")}, Alignment::kCenter),
          Paragraph({Run("Hi")}, Alignment::kRight),
          Paragraph({Run("site_plan.pdf")}, Alignment::kLeft, 36),
      },
      kFixedWidth);

  REQUIRE(lines.size() == 3);
  REQUIRE(lines[0].pieces[0].x == 301.0F);
  REQUIRE(lines[1].pieces[0].x == 530.0F);
  REQUIRE(lines[2].pieces[0].x == 108.0F);
}

TEST_CASE("Style changes split a line into pieces and adjacent runs stay glued",
          "[render][pdf]") {
  const std::vector<PdfLine> lines = LayoutPdfLines(
      {
          Paragraph({Run("Email:", 10, true), Run(" permits@intralog.test")}),
          Paragraph({Run("Mc"), Run("Intosh")}),
      },
      kFixedWidth);

  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0].pieces.size() == 2);
  REQUIRE(lines[0].pieces[0].text == "Email:");
  REQUIRE(lines[0].pieces[0].font_name == "Helvetica-Bold");
  REQUIRE(lines[0].pieces[1].text == "permits@intralog.test");
  REQUIRE(lines[0].pieces[1].font_name == "Helvetica");
  REQUIRE(lines[0].pieces[1].x == 107.0F);

  REQUIRE(lines[1].pieces.size() == 1);
  REQUIRE(lines[1].pieces[0].text == "McIntosh");
}

TEST_CASE("Lines past the bottom margin move to the next page", "[render][pdf]") {
  std::vector<RenderedParagraph> paragraphs;
  for (int i = 0; i < 41; ++i) {
    paragraphs.push_back(Paragraph({Run("line")}));
  }
  const std::vector<PdfLine> lines = LayoutPdfLines(paragraphs, kFixedWidth);

  // 12pt lines plus a 4pt paragraph gap: forty fit between the margins.
  REQUIRE(lines.size() == 41);
  REQUIRE(lines[39].page == 0);
  REQUIRE(lines[40].page == 1);
  REQUIRE(lines[40].baseline_y == 710.0F);
}

TEST_CASE("Spacer paragraphs add space without a line", "[render][pdf]") {
  const std::vector<PdfLine> lines = LayoutPdfLines(
      {Paragraph({Run("Dear Plan Review Staff,")}), Paragraph({Run("")}),
       Paragraph({Run("Body")})},
      kFixedWidth);

  REQUIRE(lines.size() == 2);
  REQUIRE(lines[1].baseline_y < 694.0F);
  REQUIRE(lines[1].baseline_y > 682.0F);
}

TEST_CASE("Runs map onto the standard PDF fonts", "[render][pdf]") {
  TextRun run;
  REQUIRE(permitpack::render::StandardFontFor(run) == "Helvetica");
  run.italic = true;
  REQUIRE(permitpack::render::StandardFontFor(run) == "Helvetica-Oblique");
  run.font = permitpack::render::kTimesNewRoman;
  REQUIRE(permitpack::render::StandardFontFor(run) == "Times-Italic");
  run.bold = true;
  REQUIRE(permitpack::render::StandardFontFor(run) == "Times-BoldItalic");
  run.italic = false;
  REQUIRE(permitpack::render::StandardFontFor(run) == "Times-Bold");
}

TEST_CASE("Text is transcoded to WinAnsi", "[render][pdf]") {
  using permitpack::render::ToWinAnsi;
  REQUIRE(ToWinAnsi("Plan Review") == "Plan Review");
  REQUIRE(ToWinAnsi("Caf\xC3\xA9") == "Caf\xE9");
  REQUIRE(ToWinAnsi("\xE2\x80\x9Cok\xE2\x80\x9D \xE2\x80\x94 it\xE2\x80\x99s") ==
          "\x93ok\x94 \x97 it\x92s");
  REQUIRE(ToWinAnsi("a\tb") == "a b");
  REQUIRE(ToWinAnsi("\xE6\x97\xA5 \xFF") == "? ?");
}

TEST_CASE("Cover letter PDF carries metadata and drawn text", "[render][pdf]") {
  TextRun heading = Run("Intralog Permit Services", 16, true);
  TextRun body = Run("Dear Plan Review Staff,", 11);
  body.font = permitpack::render::kTimesNewRoman;
  body.color = "1F3864";

  permitpack::render::PdfMetadata metadata;
  metadata.author = "Intralog Permit Services";
  std::string pdf;
  std::string error;
  REQUIRE(permitpack::render::WriteCoverLetterPdf(
      {Paragraph({heading}, Alignment::kCenter), Paragraph({body})}, metadata, false, pdf,
      error));
  REQUIRE(error.empty());
  REQUIRE(pdf.rfind("%PDF-", 0) == 0);
  REQUIRE(pdf.find("%%EOF") != std::string::npos);
  REQUIRE(pdf.find("/Helvetica-Bold") != std::string::npos);
  REQUIRE(pdf.find("/Times-Roman") != std::string::npos);
  REQUIRE(pdf.find("Dear Plan Review Staff,") != std::string::npos);
  REQUIRE(pdf.find("High-Piled Storage Permit Cover Letter") != std::string::npos);
}

TEST_CASE("An empty cover letter still produces a one page PDF", "[render][pdf]") {
  std::string pdf;
  std::string error;
  REQUIRE(permitpack::render::WriteCoverLetterPdf({}, {}, true, pdf, error));
  REQUIRE(pdf.rfind("%PDF-", 0) == 0);
  REQUIRE(pdf.find("/Count 1") != std::string::npos);
}
