#include "documents/category_order.hpp"

#include <cctype>

namespace permitpack::documents {

namespace {

int PrimaryWeight(char c) {
  const auto as_unsigned = static_cast<unsigned char>(c);
  if (as_unsigned >= 0x80U) {
    return 3 * 256 + as_unsigned;
  }
  if (std::isalpha(as_unsigned) != 0) {
    return 2 * 256 + std::tolower(as_unsigned);
  }
  if (std::isdigit(as_unsigned) != 0) {
    return 1 * 256 + as_unsigned;
  }
  return as_unsigned;
}

} // namespace

int CategoryOrder(Category category) {
  switch (category) {
  case Category::kSitePlan:
    return 0;
  case Category::kFacilityPlan:
    return 1;
  case Category::kEgressPlan:
    return 2;
  case Category::kSpecialInspection:
    return 3;
  case Category::kStructuralPlans:
    return 4;
  case Category::kFireProtection:
    return 5;
  case Category::kCommodities:
    return 6;
  case Category::kCoverLetter:
    return 7;
  case Category::kOther:
    break;
  }
  return kUnrankedCategoryOrder;
}

int CategoryOrderForName(std::string_view category_name) {
  return CategoryOrder(ParseCategory(category_name));
}

int CompareFileNames(std::string_view lhs, std::string_view rhs) {
  const std::size_t common = lhs.size() < rhs.size() ? lhs.size() : rhs.size();

  for (std::size_t i = 0; i < common; ++i) {
    const int lw = PrimaryWeight(lhs[i]);
    const int rw = PrimaryWeight(rhs[i]);
    if (lw != rw) {
      return lw < rw ? -1 : 1;
    }
  }
  if (lhs.size() != rhs.size()) {
    return lhs.size() < rhs.size() ? -1 : 1;
  }

  // Primary keys equal: only case differs (or nothing). Lowercase first.
  for (std::size_t i = 0; i < common; ++i) {
    const auto l = static_cast<unsigned char>(lhs[i]);
    const auto r = static_cast<unsigned char>(rhs[i]);
    if (l == r) {
      continue;
    }
    const bool l_lower = std::islower(l) != 0;
    const bool r_lower = std::islower(r) != 0;
    if (l_lower != r_lower) {
      return l_lower ? -1 : 1;
    }
    return l < r ? -1 : 1;
  }
  return 0;
}

bool ComparePackageOrder(const DocumentRecord& lhs, const DocumentRecord& rhs) {
  const int lhs_order = CategoryOrder(lhs.category);
  const int rhs_order = CategoryOrder(rhs.category);
  if (lhs_order != rhs_order) {
    return lhs_order < rhs_order;
  }

  const int by_name = CompareFileNames(lhs.file_name, rhs.file_name);
  if (by_name != 0) {
    return by_name < 0;
  }
  if (lhs.version != rhs.version) {
    return lhs.version < rhs.version;
  }
  return lhs.id < rhs.id;
}

} // namespace permitpack::documents
