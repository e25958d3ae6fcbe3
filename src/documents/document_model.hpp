#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace permitpack::documents {

// Fixed permit-document classifications. `kOther` absorbs any category name
// the upload layer sends that this build does not know.
enum class Category {
  kSitePlan,
  kFacilityPlan,
  kEgressPlan,
  kStructuralPlans,
  kCommodities,
  kFireProtection,
  kSpecialInspection,
  kCoverLetter,
  kOther,
};

enum class Status {
  kNotSubmitted,
  kPendingReview,
  kApproved,
  kRejected,
};

// Categories that gate submission eligibility. Everything except the cover
// letter; the denominator of the progress percentage is this array's size.
inline constexpr std::array<Category, 7> kRequiredCategories = {
    Category::kSitePlan,         Category::kFacilityPlan, Category::kEgressPlan,
    Category::kStructuralPlans,  Category::kCommodities,  Category::kFireProtection,
    Category::kSpecialInspection,
};

// One uploaded document version as handed over by the storage layer.
//
// `content` is empty (nullopt) when the bytes have not been fetched or
// could not be retrieved; a zero-length file is an engaged empty string.
// `source_path` is only used by the file-backed content source.
struct DocumentRecord {
  std::string id;
  Category category = Category::kOther;
  std::string file_name;
  std::optional<std::string> content;
  Status status = Status::kNotSubmitted;
  int version = 1;
  std::filesystem::path source_path;
};

// Project details printed on the cover letter. Empty strings mean "unknown";
// the template narrative substitutes its own wording for those.
struct ProjectInfo {
  std::string name;
  std::string jurisdiction;
  std::string facility_address;
  std::string permit_number;
  std::string contact_email;
  std::string contact_phone;
};

const char* ToString(Category category);
const char* ToString(Status status);

// Total: unknown names map to `kOther`. Accepts the `structural_analysis`
// alias used by older exports for structural plans.
Category ParseCategory(std::string_view name);

bool ParseStatus(std::string_view name, Status& status);

bool IsRequiredCategory(Category category);

// "site_plan" -> "Site Plan". Used by the template narrative and CLI tables.
std::string DisplayName(Category category);

// One-sentence description of what the authority expects in the category.
const char* CategoryDescription(Category category);

} // namespace permitpack::documents
