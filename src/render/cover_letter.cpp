#include "render/cover_letter.hpp"

#include "core/text_utils.hpp"
#include "render/docx_writer.hpp"
#include "render/pdf_writer.hpp"

namespace permitpack::render {

const char* ToString(CoverLetterFormat format) {
  switch (format) {
  case CoverLetterFormat::kDocx:
    return "docx";
  case CoverLetterFormat::kPdf:
    return "pdf";
  case CoverLetterFormat::kText:
    return "txt";
  }
  return "docx";
}

bool ParseCoverLetterFormat(std::string_view name, CoverLetterFormat& format) {
  const std::string lowered = core::ToLower(name);
  if (lowered == "docx") {
    format = CoverLetterFormat::kDocx;
    return true;
  }
  if (lowered == "pdf") {
    format = CoverLetterFormat::kPdf;
    return true;
  }
  if (lowered == "txt" || lowered == "text") {
    format = CoverLetterFormat::kText;
    return true;
  }
  return false;
}

bool RenderClassifiedCoverLetter(std::vector<narrative::ClassifiedLine> lines,
                                 const CoverLetterOptions& options, CoverLetter& cover_letter,
                                 std::string& error) {
  CoverLetter rendered;
  rendered.paragraphs = RenderLines(lines, options.profile);
  rendered.lines = std::move(lines);

  if (options.format == CoverLetterFormat::kText) {
    rendered.entry_name = std::string(kCoverLetterStem) + ".txt";
    rendered.bytes = core::JoinLines(PlainTextOf(rendered.paragraphs));
    rendered.bytes.push_back('\n');
  } else if (options.format == CoverLetterFormat::kPdf) {
    rendered.entry_name = std::string(kCoverLetterStem) + ".pdf";
    PdfMetadata metadata;
    metadata.author = options.profile.letterhead;
    if (!WriteCoverLetterPdf(rendered.paragraphs, metadata, options.zip.deflate, rendered.bytes,
                             error)) {
      return false;
    }
  } else {
    rendered.entry_name = std::string(kCoverLetterStem) + ".docx";
    if (!WriteCoverLetterDocx(rendered.paragraphs, options.zip, rendered.bytes, error)) {
      return false;
    }
  }

  cover_letter = std::move(rendered);
  return true;
}

bool RenderCoverLetter(std::string_view narrative_text, const CoverLetterOptions& options,
                       CoverLetter& cover_letter, std::string& error,
                       core::logging::Logger* logger) {
  auto lines =
      narrative::ClassifyLines(core::SplitLines(narrative_text), options.profile, logger);
  return RenderClassifiedCoverLetter(std::move(lines), options, cover_letter, error);
}

} // namespace permitpack::render
