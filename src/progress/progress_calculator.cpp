#include "progress/progress_calculator.hpp"

#include <map>
#include <utility>

namespace permitpack::progress {

namespace {

using documents::Category;
using documents::DocumentRecord;

bool Supersedes(const DocumentRecord& candidate, const DocumentRecord& current) {
  if (candidate.version != current.version) {
    return candidate.version > current.version;
  }
  return candidate.id > current.id;
}

} // namespace

int RoundedPercent(int approved, int total) {
  if (total <= 0 || approved <= 0) {
    return 0;
  }
  // (2 * 100 * a + t) / (2 * t) == floor(100 * a / t + 0.5)
  return (200 * approved + total) / (2 * total);
}

std::vector<DocumentRecord> SelectCurrentDocuments(const std::vector<DocumentRecord>& documents) {
  std::map<Category, const DocumentRecord*> current_by_category;
  for (const auto& document : documents) {
    auto [it, inserted] = current_by_category.emplace(document.category, &document);
    if (!inserted && Supersedes(document, *it->second)) {
      it->second = &document;
    }
  }

  std::vector<DocumentRecord> current;
  current.reserve(current_by_category.size());
  for (const auto& [category, record] : current_by_category) {
    current.push_back(*record);
  }
  return current;
}

ProgressReport ComputeProgress(const std::vector<DocumentRecord>& documents) {
  ProgressReport report;

  std::map<Category, DocumentRecord> current;
  for (auto& record : SelectCurrentDocuments(documents)) {
    current.emplace(record.category, std::move(record));
  }

  report.categories.reserve(documents::kRequiredCategories.size());
  for (const Category category : documents::kRequiredCategories) {
    CategoryProgress row;
    row.category = category;
    const auto it = current.find(category);
    if (it != current.end()) {
      row.current_status = it->second.status;
      row.current_version = it->second.version;
      row.approved = it->second.status == documents::Status::kApproved;
    }
    if (row.approved) {
      ++report.approved_required;
    } else {
      report.blocking.push_back(category);
    }
    report.categories.push_back(row);
  }

  report.has_cover_letter = current.find(Category::kCoverLetter) != current.end();
  report.percent = RoundedPercent(report.approved_required,
                                  static_cast<int>(documents::kRequiredCategories.size()));
  report.eligible = report.percent == 100 && report.has_cover_letter;
  return report;
}

} // namespace permitpack::progress
