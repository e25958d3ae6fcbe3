#include "render/pdf_writer.hpp"

#include <hpdf.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>
#include <type_traits>
#include <utility>

namespace permitpack::render {

namespace {

constexpr int kSpacerSizePt = 11;

struct WinAnsiExtra {
  std::uint32_t code_point;
  unsigned char byte;
};

// Windows-1252 assignments in 0x80-0x9F; 0xA0-0xFF match Latin-1.
constexpr std::array<WinAnsiExtra, 27> kWinAnsiExtras = {{
    {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84}, {0x2026, 0x85},
    {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88}, {0x2030, 0x89}, {0x0160, 0x8A},
    {0x2039, 0x8B}, {0x0152, 0x8C}, {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92},
    {0x201C, 0x93}, {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
    {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B}, {0x0153, 0x9C},
    {0x017E, 0x9E}, {0x0178, 0x9F},
}};

// Decodes one UTF-8 sequence at `pos`. Malformed input yields U+FFFD and
// consumes a single byte.
std::uint32_t NextCodePoint(std::string_view text, std::size_t& pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  int length = 1;
  std::uint32_t code_point = lead;
  if (lead >= 0xF5U) {
    ++pos;
    return 0xFFFDU;
  }
  if (lead >= 0xF0U) {
    length = 4;
    code_point = lead & 0x07U;
  } else if (lead >= 0xE0U) {
    length = 3;
    code_point = lead & 0x0FU;
  } else if (lead >= 0xC2U && lead <= 0xDFU) {
    length = 2;
    code_point = lead & 0x1FU;
  } else if (lead >= 0x80U) {
    ++pos;
    return 0xFFFDU;
  }
  if (pos + static_cast<std::size_t>(length) > text.size()) {
    ++pos;
    return 0xFFFDU;
  }
  for (int i = 1; i < length; ++i) {
    const auto next = static_cast<unsigned char>(text[pos + static_cast<std::size_t>(i)]);
    if ((next & 0xC0U) != 0x80U) {
      ++pos;
      return 0xFFFDU;
    }
    code_point = (code_point << 6U) | (next & 0x3FU);
  }
  pos += static_cast<std::size_t>(length);
  return code_point;
}

struct Word {
  std::string text;
  std::string font_name;
  int size_pt = 11;
  std::string color;
  // Set when the source text had no space before this word.
  bool glued = false;
};

std::vector<Word> WordsOf(const RenderedParagraph& paragraph) {
  std::vector<Word> words;
  bool previous_ended_with_space = true;
  for (const auto& run : paragraph.runs) {
    const std::string text = ToWinAnsi(run.text);
    if (text.empty()) {
      continue;
    }
    const std::string font_name = StandardFontFor(run);
    std::size_t pos = 0;
    while (pos < text.size()) {
      const std::size_t start = text.find_first_not_of(' ', pos);
      if (start == std::string::npos) {
        break;
      }
      const std::size_t end = std::min(text.find(' ', start), text.size());
      Word word;
      word.text = text.substr(start, end - start);
      word.font_name = font_name;
      word.size_pt = run.size_pt;
      word.color = run.color;
      word.glued = start == 0U && !previous_ended_with_space && !words.empty();
      words.push_back(std::move(word));
      pos = end;
    }
    previous_ended_with_space = text.back() == ' ';
  }
  return words;
}

bool SameStyle(const PlacedText& piece, const Word& word) {
  return piece.font_name == word.font_name && piece.size_pt == word.size_pt &&
         piece.color == word.color;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

// "RRGGBB" to fill components; anything else is black.
std::array<float, 3> FillColor(const std::string& hex) {
  std::array<float, 3> rgb = {0.0F, 0.0F, 0.0F};
  if (hex.size() != 6U) {
    return rgb;
  }
  for (std::size_t i = 0; i < 3U; ++i) {
    const int high = HexDigit(hex[2U * i]);
    const int low = HexDigit(hex[2U * i + 1U]);
    if (high < 0 || low < 0) {
      return {0.0F, 0.0F, 0.0F};
    }
    rgb[i] = static_cast<float>(high * 16 + low) / 255.0F;
  }
  return rgb;
}

void HPDF_STDCALL RecordHpdfError(HPDF_STATUS error_no, HPDF_STATUS detail_no, void* user_data) {
  auto* message = static_cast<std::string*>(user_data);
  if (!message->empty()) {
    return;
  }
  std::ostringstream out;
  out << "libharu error 0x" << std::hex << std::setw(4) << std::setfill('0') << error_no
      << std::dec << " (detail " << detail_no << ")";
  *message = out.str();
}

struct DocDeleter {
  void operator()(HPDF_Doc doc) const {
    HPDF_Free(doc);
  }
};

using DocHandle = std::unique_ptr<std::remove_pointer_t<HPDF_Doc>, DocDeleter>;

} // namespace

std::string StandardFontFor(const TextRun& run) {
  if (run.font == kTimesNewRoman) {
    if (run.bold && run.italic) {
      return "Times-BoldItalic";
    }
    if (run.bold) {
      return "Times-Bold";
    }
    return run.italic ? "Times-Italic" : "Times-Roman";
  }
  if (run.bold && run.italic) {
    return "Helvetica-BoldOblique";
  }
  if (run.bold) {
    return "Helvetica-Bold";
  }
  return run.italic ? "Helvetica-Oblique" : "Helvetica";
}

std::string ToWinAnsi(std::string_view utf8) {
  std::string out;
  out.reserve(utf8.size());
  std::size_t pos = 0;
  while (pos < utf8.size()) {
    const std::uint32_t code_point = NextCodePoint(utf8, pos);
    if (code_point == '\t') {
      out.push_back(' ');
    } else if (code_point < 0x20U || code_point == 0x7FU) {
      continue;
    } else if (code_point < 0x80U || (code_point >= 0xA0U && code_point <= 0xFFU)) {
      out.push_back(static_cast<char>(code_point));
    } else {
      const auto extra =
          std::find_if(kWinAnsiExtras.begin(), kWinAnsiExtras.end(),
                       [code_point](const WinAnsiExtra& e) { return e.code_point == code_point; });
      out.push_back(extra == kWinAnsiExtras.end() ? '?' : static_cast<char>(extra->byte));
    }
  }
  return out;
}

std::vector<PdfLine> LayoutPdfLines(const std::vector<RenderedParagraph>& paragraphs,
                                    const PdfTextMeasure& measure) {
  const float top = kPdfPageHeightPt - kPdfMarginPt;
  const float content_width = kPdfPageWidthPt - 2.0F * kPdfMarginPt;

  std::vector<PdfLine> lines;
  int page = 0;
  float y = top; // top of the next line box

  // Moves to a fresh page when `height` does not fit above the bottom margin.
  const auto reserve = [&](float height) {
    if (y - height < kPdfMarginPt && y < top) {
      ++page;
      y = top;
    }
  };

  for (const auto& paragraph : paragraphs) {
    const std::vector<Word> words = WordsOf(paragraph);
    if (words.empty()) {
      const float height = static_cast<float>(kSpacerSizePt) * kPdfLineHeightFactor * 0.5F;
      reserve(height);
      y -= height;
      continue;
    }

    int max_size = 0;
    for (const auto& word : words) {
      max_size = std::max(max_size, word.size_pt);
    }
    const float line_height = static_cast<float>(max_size) * kPdfLineHeightFactor;
    const float indent = static_cast<float>(paragraph.indent_left_pt);
    const float left = kPdfMarginPt + indent;
    const float available = content_width - indent;

    const auto gap_before = [&](std::size_t index, std::size_t line_start) {
      const Word& word = words[index];
      return index == line_start || word.glued
                 ? 0.0F
                 : measure(" ", word.font_name, word.size_pt);
    };

    std::size_t line_start = 0;
    while (line_start < words.size()) {
      // Greedy fill; a word wider than the line still gets a line of its own.
      float width = 0.0F;
      std::size_t line_end = line_start;
      for (; line_end < words.size(); ++line_end) {
        const Word& word = words[line_end];
        const float advance =
            gap_before(line_end, line_start) + measure(word.text, word.font_name, word.size_pt);
        if (line_end > line_start && width + advance > available) {
          break;
        }
        width += advance;
      }

      reserve(line_height);
      PdfLine line;
      line.page = page;
      line.baseline_y = y - static_cast<float>(max_size);

      float x = left;
      if (paragraph.alignment == Alignment::kCenter) {
        x = left + (available - width) / 2.0F;
      } else if (paragraph.alignment == Alignment::kRight) {
        x = left + available - width;
      }
      for (std::size_t i = line_start; i < line_end; ++i) {
        const Word& word = words[i];
        const float gap = gap_before(i, line_start);
        if (!line.pieces.empty() && SameStyle(line.pieces.back(), word)) {
          line.pieces.back().text += gap > 0.0F ? " " + word.text : word.text;
        } else {
          PlacedText piece;
          piece.text = word.text;
          piece.font_name = word.font_name;
          piece.size_pt = word.size_pt;
          piece.color = word.color;
          piece.x = x + gap;
          line.pieces.push_back(std::move(piece));
        }
        x += gap + measure(word.text, word.font_name, word.size_pt);
      }

      lines.push_back(std::move(line));
      y -= line_height;
      line_start = line_end;
    }
    y -= kPdfParagraphGapPt;
  }
  return lines;
}

bool WriteCoverLetterPdf(const std::vector<RenderedParagraph>& paragraphs,
                         const PdfMetadata& metadata, bool compress, std::string& pdf_bytes,
                         std::string& error) {
  std::string hpdf_error;
  DocHandle doc(HPDF_New(RecordHpdfError, &hpdf_error));
  if (!doc) {
    error = "failed to create PDF document";
    return false;
  }
  const auto failed = [&](std::string_view step) {
    error = "PDF " + std::string(step) + " failed";
    if (!hpdf_error.empty()) {
      error += ": " + hpdf_error;
    }
    return false;
  };

  if (HPDF_SetCompressionMode(doc.get(), compress ? HPDF_COMP_ALL : HPDF_COMP_NONE) != HPDF_OK) {
    return failed("compression setup");
  }
  const std::array<std::pair<HPDF_InfoType, const std::string*>, 4> info = {{
      {HPDF_INFO_TITLE, &metadata.title},
      {HPDF_INFO_AUTHOR, &metadata.author},
      {HPDF_INFO_SUBJECT, &metadata.subject},
      {HPDF_INFO_KEYWORDS, &metadata.keywords},
  }};
  for (const auto& [type, value] : info) {
    if (!value->empty() && HPDF_SetInfoAttr(doc.get(), type, value->c_str()) != HPDF_OK) {
      return failed("metadata");
    }
  }
  if (HPDF_SetInfoAttr(doc.get(), HPDF_INFO_CREATOR, "permitpack") != HPDF_OK) {
    return failed("metadata");
  }

  std::map<std::string, HPDF_Font> fonts;
  const auto font_for = [&](const std::string& name) -> HPDF_Font {
    const auto it = fonts.find(name);
    if (it != fonts.end()) {
      return it->second;
    }
    HPDF_Font font = HPDF_GetFont(doc.get(), name.c_str(), "WinAnsiEncoding");
    if (font != nullptr) {
      fonts.emplace(name, font);
    }
    return font;
  };

  bool fonts_ok = true;
  const PdfTextMeasure measure = [&](std::string_view text, const std::string& font_name,
                                     int size_pt) -> float {
    HPDF_Font font = font_for(font_name);
    if (font == nullptr) {
      fonts_ok = false;
      return 0.0F;
    }
    const HPDF_TextWidth measured =
        HPDF_Font_TextWidth(font, reinterpret_cast<const HPDF_BYTE*>(text.data()),
                            static_cast<HPDF_UINT>(text.size()));
    return static_cast<float>(measured.width) * static_cast<float>(size_pt) / 1000.0F;
  };
  const std::vector<PdfLine> lines = LayoutPdfLines(paragraphs, measure);
  if (!fonts_ok) {
    return failed("font loading");
  }

  std::vector<HPDF_Page> pages;
  const auto page_at = [&](int index) -> HPDF_Page {
    while (static_cast<int>(pages.size()) <= index) {
      HPDF_Page page = HPDF_AddPage(doc.get());
      if (page == nullptr ||
          HPDF_Page_SetSize(page, HPDF_PAGE_SIZE_LETTER, HPDF_PAGE_PORTRAIT) != HPDF_OK) {
        return nullptr;
      }
      pages.push_back(page);
    }
    return pages[static_cast<std::size_t>(index)];
  };
  if (page_at(0) == nullptr) {
    return failed("page creation");
  }

  for (const auto& line : lines) {
    HPDF_Page page = page_at(line.page);
    if (page == nullptr) {
      return failed("page creation");
    }
    for (const auto& piece : line.pieces) {
      const std::array<float, 3> rgb = FillColor(piece.color);
      if (HPDF_Page_SetRGBFill(page, rgb[0], rgb[1], rgb[2]) != HPDF_OK ||
          HPDF_Page_BeginText(page) != HPDF_OK ||
          HPDF_Page_SetFontAndSize(page, font_for(piece.font_name),
                                   static_cast<HPDF_REAL>(piece.size_pt)) != HPDF_OK ||
          HPDF_Page_TextOut(page, piece.x, line.baseline_y, piece.text.c_str()) != HPDF_OK ||
          HPDF_Page_EndText(page) != HPDF_OK) {
        return failed("text drawing");
      }
    }
  }

  if (HPDF_SaveToStream(doc.get()) != HPDF_OK) {
    return failed("serialization");
  }
  HPDF_UINT32 size = HPDF_GetStreamSize(doc.get());
  std::string bytes(static_cast<std::size_t>(size), '\0');
  if (HPDF_ResetStream(doc.get()) != HPDF_OK) {
    return failed("stream rewind");
  }
  const HPDF_STATUS read_status =
      HPDF_ReadFromStream(doc.get(), reinterpret_cast<HPDF_BYTE*>(bytes.data()), &size);
  if (read_status != HPDF_OK && read_status != HPDF_STREAM_EOF) {
    return failed("stream read");
  }
  bytes.resize(static_cast<std::size_t>(size));
  pdf_bytes = std::move(bytes);
  return true;
}

} // namespace permitpack::render
