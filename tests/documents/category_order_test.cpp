#include "documents/category_order.hpp"

#include "common/document_fixtures.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace {

using permitpack::documents::Category;
using permitpack::documents::DocumentRecord;
using permitpack::tests::common::MakeDocument;

std::vector<std::string> SortedIds(std::vector<DocumentRecord> records) {
  std::sort(records.begin(), records.end(), permitpack::documents::ComparePackageOrder);
  std::vector<std::string> ids;
  for (const auto& record : records) {
    ids.push_back(record.id);
  }
  return ids;
}

} // namespace

TEST_CASE("Category order follows the canonical package sequence", "[documents][order]") {
  using permitpack::documents::CategoryOrder;
  REQUIRE(CategoryOrder(Category::kSitePlan) == 0);
  REQUIRE(CategoryOrder(Category::kFacilityPlan) == 1);
  REQUIRE(CategoryOrder(Category::kEgressPlan) == 2);
  REQUIRE(CategoryOrder(Category::kSpecialInspection) == 3);
  REQUIRE(CategoryOrder(Category::kStructuralPlans) == 4);
  REQUIRE(CategoryOrder(Category::kFireProtection) == 5);
  REQUIRE(CategoryOrder(Category::kCommodities) == 6);
  REQUIRE(CategoryOrder(Category::kCoverLetter) == 7);
  REQUIRE(CategoryOrder(Category::kOther) == permitpack::documents::kUnrankedCategoryOrder);
}

TEST_CASE("Unknown category names sort last instead of failing", "[documents][order]") {
  using permitpack::documents::CategoryOrderForName;
  REQUIRE(CategoryOrderForName("zoning_variance") ==
          permitpack::documents::kUnrankedCategoryOrder);
  REQUIRE(CategoryOrderForName("") == permitpack::documents::kUnrankedCategoryOrder);
  REQUIRE(CategoryOrderForName("structural_analysis") == 4);
  REQUIRE(permitpack::documents::ParseCategory("Site_Plan") == Category::kOther);
}

TEST_CASE("File names collate punctuation, digits, then letters", "[documents][order]") {
  using permitpack::documents::CompareFileNames;
  REQUIRE(CompareFileNames("_notes.pdf", "1_plan.pdf") < 0);
  REQUIRE(CompareFileNames("1_plan.pdf", "a_plan.pdf") < 0);
  REQUIRE(CompareFileNames("Alpha.pdf", "beta.pdf") < 0);
  REQUIRE(CompareFileNames("plan.pdf", "Plan.pdf") < 0);
  REQUIRE(CompareFileNames("plan", "plan.pdf") < 0);
  REQUIRE(CompareFileNames("same.pdf", "same.pdf") == 0);
}

TEST_CASE("Package ordering does not depend on input order", "[documents][order]") {
  std::vector<DocumentRecord> records = {
      MakeDocument("x1", Category::kOther, "appendix.pdf"),
      MakeDocument("c1", Category::kCommodities, "b_list.pdf"),
      MakeDocument("c2", Category::kCommodities, "a_list.pdf"),
      MakeDocument("s1", Category::kSitePlan, "site.pdf"),
      MakeDocument("i1", Category::kSpecialInspection, "agreement.pdf"),
      MakeDocument("dup-b", Category::kFireProtection, "same.pdf"),
      MakeDocument("dup-a", Category::kFireProtection, "same.pdf"),
  };

  const std::vector<std::string> expected = {"s1", "i1", "dup-a", "dup-b", "c2", "c1", "x1"};
  REQUIRE(SortedIds(records) == expected);

  std::sort(records.begin(), records.end(),
            [](const DocumentRecord& lhs, const DocumentRecord& rhs) { return lhs.id < rhs.id; });
  do {
    REQUIRE(SortedIds(records) == expected);
  } while (std::next_permutation(
      records.begin(), records.end(),
      [](const DocumentRecord& lhs, const DocumentRecord& rhs) { return lhs.id < rhs.id; }));
}

TEST_CASE("Display names title-case the wire name", "[documents][model]") {
  REQUIRE(permitpack::documents::DisplayName(Category::kFireProtection) == "Fire Protection");
  REQUIRE(permitpack::documents::DisplayName(Category::kSitePlan) == "Site Plan");
  REQUIRE(permitpack::documents::IsRequiredCategory(Category::kCommodities));
  REQUIRE_FALSE(permitpack::documents::IsRequiredCategory(Category::kCoverLetter));
  REQUIRE_FALSE(permitpack::documents::IsRequiredCategory(Category::kOther));
}
