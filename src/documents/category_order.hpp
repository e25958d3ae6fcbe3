#pragma once

#include "documents/document_model.hpp"

#include <string_view>

namespace permitpack::documents {

// Rank assigned to categories outside the canonical package sequence.
inline constexpr int kUnrankedCategoryOrder = 8;

// Position of a category in every submission package.
//
// Canonical sequence: site plan, facility plan, egress plan, special
// inspection, structural plans, fire protection, commodities, cover letter,
// then anything unrecognized. Pure and total.
int CategoryOrder(Category category);

// Same order keyed by the raw category name, so names this build does not
// know land in the trailing bucket instead of failing.
int CategoryOrderForName(std::string_view category_name);

// Collation used for file-name tie breaks: punctuation before digits before
// letters, case-insensitive first, lowercase before uppercase on a tie and
// raw bytes last. Returns <0, 0 or >0.
int CompareFileNames(std::string_view lhs, std::string_view rhs);

// Strict weak ordering used wherever package entries are sorted: category
// order first, then file name, then id so equal names never reorder.
bool ComparePackageOrder(const DocumentRecord& lhs, const DocumentRecord& rhs);

} // namespace permitpack::documents
