#pragma once

#include "documents/document_model.hpp"

#include <optional>
#include <vector>

namespace permitpack::progress {

// Current state of one required category after collapsing versions.
struct CategoryProgress {
  documents::Category category = documents::Category::kOther;
  // Empty when no document was ever uploaded for the category.
  std::optional<documents::Status> current_status;
  int current_version = 0;
  bool approved = false;
};

struct ProgressReport {
  int percent = 0;
  bool eligible = false;
  int approved_required = 0;
  bool has_cover_letter = false;
  // One row per required category, in required-set order.
  std::vector<CategoryProgress> categories;
  // Required categories whose current document is missing or not approved.
  std::vector<documents::Category> blocking;
};

// round_half_up(100 * approved / total) in integer arithmetic.
int RoundedPercent(int approved, int total);

// Picks the highest-version record per category, input order irrelevant.
// A version tie keeps the record with the greater id so the pick is stable.
std::vector<documents::DocumentRecord> SelectCurrentDocuments(
    const std::vector<documents::DocumentRecord>& documents);

// Completion percentage and submission eligibility.
//
// Contract:
// - percent counts required categories whose current record is approved,
//   over the fixed required-set size (7), never over the input size.
// - eligible iff percent == 100 and a current cover letter exists.
// - empty input yields {0, false}.
ProgressReport ComputeProgress(const std::vector<documents::DocumentRecord>& documents);

} // namespace permitpack::progress
