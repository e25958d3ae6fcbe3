#pragma once

#include "archive/zip_writer.hpp"
#include "render/document_renderer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace permitpack::render {

// Page geometry shared by every cover letter: US Letter, 1 inch margins.
inline constexpr int kTwipsPerPoint = 20;
inline constexpr int kPageWidthTwips = 12240;
inline constexpr int kPageHeightTwips = 15840;
inline constexpr int kPageMarginTwips = 1440;

// Escapes &, <, >, " and ' and drops control characters XML 1.0 cannot
// carry (tab is kept).
std::string EscapeXml(std::string_view text);

// `word/document.xml` for the given paragraphs. Sizes are written in
// half-points and indents in twips.
std::string BuildDocumentXml(const std::vector<RenderedParagraph>& paragraphs);

// Serializes paragraphs as a minimal WordprocessingML package:
// [Content_Types].xml, _rels/.rels and word/document.xml in a zip container.
bool WriteCoverLetterDocx(const std::vector<RenderedParagraph>& paragraphs,
                          const archive::ZipOptions& zip_options, std::string& docx_bytes,
                          std::string& error);

} // namespace permitpack::render
