#ifndef PERMITPACK_TESTS_COMMON_DOCUMENT_FIXTURES_HPP_
#define PERMITPACK_TESTS_COMMON_DOCUMENT_FIXTURES_HPP_

#include "documents/document_model.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace permitpack::tests::common {

inline documents::DocumentRecord MakeDocument(std::string id, documents::Category category,
                                              std::string file_name,
                                              documents::Status status =
                                                  documents::Status::kApproved,
                                              int version = 1,
                                              std::optional<std::string> content = std::nullopt) {
  documents::DocumentRecord record;
  record.id = std::move(id);
  record.category = category;
  record.file_name = std::move(file_name);
  record.status = status;
  record.version = version;
  record.content = std::move(content);
  return record;
}

// One approved document per required category, deliberately listed out of
// package order, each carrying `{id}-bytes` as content.
inline std::vector<documents::DocumentRecord> MakeApprovedRequiredSet() {
  using documents::Category;
  std::vector<documents::DocumentRecord> records = {
      MakeDocument("d-commodities", Category::kCommodities, "commodity_list.xlsx"),
      MakeDocument("d-egress", Category::kEgressPlan, "egress.pdf"),
      MakeDocument("d-structural", Category::kStructuralPlans, "rack_calcs.pdf"),
      MakeDocument("d-site", Category::kSitePlan, "site_plan.pdf"),
      MakeDocument("d-fire", Category::kFireProtection, "sprinklers.pdf"),
      MakeDocument("d-special", Category::kSpecialInspection, "special_inspection.pdf"),
      MakeDocument("d-facility", Category::kFacilityPlan, "floor_plan.pdf"),
  };
  for (auto& record : records) {
    record.content = record.id + "-bytes";
  }
  return records;
}

} // namespace permitpack::tests::common

#endif // PERMITPACK_TESTS_COMMON_DOCUMENT_FIXTURES_HPP_
