#pragma once

#include "archive/zip_writer.hpp"
#include "core/logging/logger.hpp"
#include "narrative/line_classifier.hpp"
#include "render/document_renderer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace permitpack::render {

inline constexpr const char* kCoverLetterStem = "00_Cover_Letter";

enum class CoverLetterFormat {
  kDocx,
  kPdf,
  kText,
};

const char* ToString(CoverLetterFormat format);
bool ParseCoverLetterFormat(std::string_view name, CoverLetterFormat& format);

struct CoverLetterOptions {
  narrative::ClassifierProfile profile;
  CoverLetterFormat format = CoverLetterFormat::kDocx;
  archive::ZipOptions zip;
};

// The rendered cover letter as it enters the package (entry 0).
struct CoverLetter {
  std::string entry_name;
  std::string bytes;
  std::vector<narrative::ClassifiedLine> lines;
  std::vector<RenderedParagraph> paragraphs;
};

// Classify, render and serialize a flat narrative.
//
// Contract:
// - `entry_name` is `00_Cover_Letter.` plus `docx`, `pdf` or `txt`.
// - text output is the PlainTextOf projection joined by '\n' with a trailing
//   newline.
// - pdf output carries the letterhead as author and is deflated when
//   `zip.deflate` is set.
// - only the docx and pdf serializations can fail; classification and
//   rendering are total.
bool RenderCoverLetter(std::string_view narrative_text, const CoverLetterOptions& options,
                       CoverLetter& cover_letter, std::string& error,
                       core::logging::Logger* logger = nullptr);

// Same pipeline for a narrative whose lines already carry roles.
bool RenderClassifiedCoverLetter(std::vector<narrative::ClassifiedLine> lines,
                                 const CoverLetterOptions& options, CoverLetter& cover_letter,
                                 std::string& error);

} // namespace permitpack::render
