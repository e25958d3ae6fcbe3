#include "render/docx_writer.hpp"

#include <sstream>

namespace permitpack::render {

namespace {

constexpr std::string_view kContentTypesXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" "
    "ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" "
    "ContentType=\"application/"
    "vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "</Types>";

constexpr std::string_view kPackageRelsXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
    "Target=\"word/document.xml\"/>"
    "</Relationships>";

const char* JustificationValue(Alignment alignment) {
  switch (alignment) {
  case Alignment::kCenter:
    return "center";
  case Alignment::kRight:
    return "right";
  case Alignment::kLeft:
    break;
  }
  return "left";
}

void AppendRun(std::ostringstream& out, const TextRun& run) {
  out << "<w:r><w:rPr>";
  if (!run.font.empty()) {
    const std::string font = EscapeXml(run.font);
    out << "<w:rFonts w:ascii=\"" << font << "\" w:hAnsi=\"" << font << "\" w:cs=\"" << font
        << "\"/>";
  }
  if (run.bold) {
    out << "<w:b/>";
  }
  if (run.italic) {
    out << "<w:i/>";
  }
  if (!run.color.empty()) {
    out << "<w:color w:val=\"" << EscapeXml(run.color) << "\"/>";
  }
  // Half-points.
  out << "<w:sz w:val=\"" << run.size_pt * 2 << "\"/>";
  out << "</w:rPr>";
  if (!run.text.empty()) {
    out << "<w:t xml:space=\"preserve\">" << EscapeXml(run.text) << "</w:t>";
  }
  out << "</w:r>";
}

void AppendParagraph(std::ostringstream& out, const RenderedParagraph& paragraph) {
  out << "<w:p><w:pPr>";
  if (paragraph.indent_left_pt > 0) {
    out << "<w:ind w:left=\"" << paragraph.indent_left_pt * kTwipsPerPoint << "\"/>";
  }
  out << "<w:jc w:val=\"" << JustificationValue(paragraph.alignment) << "\"/>";
  out << "</w:pPr>";
  for (const auto& run : paragraph.runs) {
    AppendRun(out, run);
  }
  out << "</w:p>";
}

} // namespace

std::string EscapeXml(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&apos;";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20U && c != '\t') {
        break;
      }
      out.push_back(c);
      break;
    }
  }
  return out;
}

std::string BuildDocumentXml(const std::vector<RenderedParagraph>& paragraphs) {
  std::ostringstream out;
  out << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
      << "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\">"
      << "<w:body>";
  for (const auto& paragraph : paragraphs) {
    AppendParagraph(out, paragraph);
  }
  out << "<w:sectPr>"
      << "<w:pgSz w:w=\"" << kPageWidthTwips << "\" w:h=\"" << kPageHeightTwips << "\"/>"
      << "<w:pgMar w:top=\"" << kPageMarginTwips << "\" w:right=\"" << kPageMarginTwips
      << "\" w:bottom=\"" << kPageMarginTwips << "\" w:left=\"" << kPageMarginTwips
      << "\" w:header=\"720\" w:footer=\"720\" w:gutter=\"0\"/>"
      << "</w:sectPr>"
      << "</w:body></w:document>";
  return out.str();
}

bool WriteCoverLetterDocx(const std::vector<RenderedParagraph>& paragraphs,
                          const archive::ZipOptions& zip_options, std::string& docx_bytes,
                          std::string& error) {
  const std::string document_xml = BuildDocumentXml(paragraphs);
  const std::vector<archive::ZipEntryView> parts = {
      {"[Content_Types].xml", kContentTypesXml},
      {"_rels/.rels", kPackageRelsXml},
      {"word/document.xml", document_xml},
  };
  if (!archive::BuildZipArchive(parts, zip_options, docx_bytes, error)) {
    error = "failed to build cover letter document: " + error;
    return false;
  }
  return true;
}

} // namespace permitpack::render
