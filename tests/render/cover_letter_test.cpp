#include "render/cover_letter.hpp"
#include "render/docx_writer.hpp"

#include "common/zip_reader.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace {

constexpr const char* kNarrative = "Intralog Permit Services\n"
                                   "October 19, 2026\n"
                                   "\n"
                                   "Dear Plan Review Staff,\n"
                                   "**1. Site Plan**\n"
                                   "Files Submitted:\n"
                                   "    site <plan> & notes.pdf\n"
                                   "Generated by PainlessPermit\n";

} // namespace

TEST_CASE("Document XML carries run formatting", "[render][docx]") {
  permitpack::render::RenderedParagraph paragraph;
  paragraph.alignment = permitpack::render::Alignment::kCenter;
  paragraph.indent_left_pt = 9;
  permitpack::render::TextRun run;
  run.text = "A & B";
  run.bold = true;
  run.italic = true;
  run.size_pt = 10;
  run.font = "Times New Roman";
  run.color = "666666";
  paragraph.runs.push_back(run);

  const std::string xml = permitpack::render::BuildDocumentXml({paragraph});
  REQUIRE(xml.find("<w:ind w:left=\"180\"/>") != std::string::npos);
  REQUIRE(xml.find("<w:jc w:val=\"center\"/>") != std::string::npos);
  REQUIRE(xml.find("w:ascii=\"Times New Roman\"") != std::string::npos);
  REQUIRE(xml.find("<w:b/>") != std::string::npos);
  REQUIRE(xml.find("<w:i/>") != std::string::npos);
  REQUIRE(xml.find("<w:color w:val=\"666666\"/>") != std::string::npos);
  REQUIRE(xml.find("<w:sz w:val=\"20\"/>") != std::string::npos);
  REQUIRE(xml.find("<w:t xml:space=\"preserve\">A &amp; B</w:t>") != std::string::npos);
  REQUIRE(xml.find("<w:pgMar w:top=\"1440\"") != std::string::npos);
}

TEST_CASE("XML escaping drops control characters but keeps tabs", "[render][docx]") {
  REQUIRE(permitpack::render::EscapeXml("a<b>\"c'\x01\td") == "a&lt;b&gt;&quot;c&apos;\td");
}

TEST_CASE("Docx cover letter is a three part zip package", "[render][docx]") {
  permitpack::render::CoverLetter letter;
  std::string error;
  REQUIRE(permitpack::render::RenderCoverLetter(kNarrative, {}, letter, error));
  REQUIRE(letter.entry_name == "00_Cover_Letter.docx");
  REQUIRE(letter.bytes.substr(0, 2) == "PK");

  const auto parts = permitpack::tests::common::ReadZipEntries(letter.bytes);
  REQUIRE(parts.size() == 3U);
  REQUIRE(parts[0].name == "[Content_Types].xml");
  REQUIRE(parts[1].name == "_rels/.rels");
  REQUIRE(parts[2].name == "word/document.xml");

  const std::string& document_xml = parts[2].bytes;
  REQUIRE(document_xml.find("site &lt;plan&gt; &amp; notes.pdf") != std::string::npos);
  REQUIRE(document_xml.find("1. Site Plan") != std::string::npos);
  REQUIRE(document_xml.find("**") == std::string::npos);
}

TEST_CASE("Text cover letter is the plain projection", "[render][text]") {
  permitpack::render::CoverLetterOptions options;
  options.format = permitpack::render::CoverLetterFormat::kText;

  permitpack::render::CoverLetter letter;
  std::string error;
  REQUIRE(permitpack::render::RenderCoverLetter(kNarrative, options, letter, error));
  REQUIRE(letter.entry_name == "00_Cover_Letter.txt");
  REQUIRE(letter.bytes == "Intralog Permit Services\n"
                          "October 19, 2026\n"
                          "\n"
                          "Dear Plan Review Staff,\n"
                          "1. Site Plan\n"
                          "Files Submitted:\n"
                          "    site <plan> & notes.pdf\n"
                          "Generated by PainlessPermit\n");
}

TEST_CASE("Cover letter formats parse case-insensitively", "[render]") {
  permitpack::render::CoverLetterFormat format = permitpack::render::CoverLetterFormat::kDocx;
  REQUIRE(permitpack::render::ParseCoverLetterFormat("TEXT", format));
  REQUIRE(format == permitpack::render::CoverLetterFormat::kText);
  REQUIRE(permitpack::render::ParseCoverLetterFormat("docx", format));
  REQUIRE(format == permitpack::render::CoverLetterFormat::kDocx);
  REQUIRE(permitpack::render::ParseCoverLetterFormat("Pdf", format));
  REQUIRE(format == permitpack::render::CoverLetterFormat::kPdf);
  REQUIRE_FALSE(permitpack::render::ParseCoverLetterFormat("odt", format));
  REQUIRE(format == permitpack::render::CoverLetterFormat::kPdf);
}

TEST_CASE("A pdf cover letter is a PDF entry authored by the letterhead", "[render][pdf]") {
  permitpack::render::CoverLetterOptions options;
  options.format = permitpack::render::CoverLetterFormat::kPdf;
  options.zip.deflate = false;
  permitpack::render::CoverLetter letter;
  std::string error;
  REQUIRE(permitpack::render::RenderCoverLetter(kNarrative, options, letter, error));
  REQUIRE(letter.entry_name == "00_Cover_Letter.pdf");
  REQUIRE(letter.bytes.rfind("%PDF-", 0) == 0);
  REQUIRE(letter.bytes.find("Dear Plan Review Staff,") != std::string::npos);
  REQUIRE(letter.bytes.find(options.profile.letterhead) != std::string::npos);
}
