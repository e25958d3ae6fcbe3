#include "render/document_renderer.hpp"

#include "narrative/line_classifier.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using permitpack::narrative::ClassifyLines;
using permitpack::narrative::LineRole;
using permitpack::render::Alignment;
using permitpack::render::RenderLines;
using permitpack::render::StyleForRole;

TEST_CASE("File entries render identically under every category", "[render][style]") {
  const std::vector<std::string> narrative = {
      "1. Site Plan",
      "Files Submitted:",
      "    site_overview.pdf",
      "4. Special Inspection",
      "Files Submitted:",
      "    specialinspection_v3 (2 copies).pdf",
  };
  const auto paragraphs = RenderLines(ClassifyLines(narrative));
  REQUIRE(paragraphs.size() == narrative.size());

  const auto& site_entry = paragraphs[2];
  const auto& inspection_entry = paragraphs[5];
  for (const auto* paragraph : {&site_entry, &inspection_entry}) {
    REQUIRE(paragraph->indent_left_pt == 9);
    REQUIRE(paragraph->alignment == Alignment::kLeft);
    REQUIRE(paragraph->runs.size() == 1U);
    REQUIRE(paragraph->runs[0].size_pt == 10);
    REQUIRE(paragraph->runs[0].font == "Times New Roman");
    REQUIRE_FALSE(paragraph->runs[0].bold);
  }
  REQUIRE(inspection_entry.runs[0].text == "specialinspection_v3.pdf");
}

TEST_CASE("Role styles match the letter layout", "[render][style]") {
  const auto header = StyleForRole(LineRole::kHeader);
  REQUIRE(header.size_pt == 14);
  REQUIRE(header.bold);
  REQUIRE(header.alignment == Alignment::kCenter);

  REQUIRE(StyleForRole(LineRole::kDate).alignment == Alignment::kRight);
  REQUIRE(StyleForRole(LineRole::kSubject).bold);
  REQUIRE_FALSE(StyleForRole(LineRole::kSalutation).bold);

  const auto footer = StyleForRole(LineRole::kFooter);
  REQUIRE(footer.size_pt == 9);
  REQUIRE(footer.italic);
  REQUIRE(footer.alignment == Alignment::kCenter);
  REQUIRE(std::string(footer.color) == "666666");

  REQUIRE(std::string(StyleForRole(LineRole::kBody).font) == "Times New Roman");
  REQUIRE(StyleForRole(LineRole::kBody).size_pt == 11);
}

TEST_CASE("Contact lines split into a bold label and a plain value", "[render][style]") {
  const auto paragraphs = RenderLines(ClassifyLines({"Email: permits@example.com"}));
  REQUIRE(paragraphs.size() == 1U);
  REQUIRE(paragraphs[0].runs.size() == 2U);
  REQUIRE(paragraphs[0].runs[0].text == "Email:");
  REQUIRE(paragraphs[0].runs[0].bold);
  REQUIRE(paragraphs[0].runs[1].text == " permits@example.com");
  REQUIRE_FALSE(paragraphs[0].runs[1].bold);
}

TEST_CASE("Only the signature closing is bold", "[render][style]") {
  const auto paragraphs = RenderLines(ClassifyLines({"Sincerely,", "Permit Services Team"}));
  REQUIRE(paragraphs.size() == 2U);
  REQUIRE_FALSE(paragraphs[0].runs[0].bold);
  REQUIRE(paragraphs[1].runs[0].bold);
}

TEST_CASE("Skipped raw lines become spacer paragraphs", "[render][spacing]") {
  const std::vector<std::string> narrative = {"", "Dear Reviewer,", "", "", "Body text"};
  const auto paragraphs = RenderLines(ClassifyLines(narrative));
  REQUIRE(paragraphs.size() == 5U);
  REQUIRE(permitpack::render::IsSpacer(paragraphs[0]));
  REQUIRE_FALSE(permitpack::render::IsSpacer(paragraphs[1]));
  REQUIRE(permitpack::render::IsSpacer(paragraphs[2]));
  REQUIRE(permitpack::render::IsSpacer(paragraphs[3]));
  REQUIRE(paragraphs[4].runs[0].text == "Body text");

  const auto text = permitpack::render::PlainTextOf(paragraphs);
  REQUIRE(text == std::vector<std::string>{"", "Dear Reviewer,", "", "", "Body text"});
}
