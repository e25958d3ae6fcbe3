#include "documents/document_model.hpp"

#include <algorithm>
#include <cctype>

namespace permitpack::documents {

const char* ToString(Category category) {
  switch (category) {
  case Category::kSitePlan:
    return "site_plan";
  case Category::kFacilityPlan:
    return "facility_plan";
  case Category::kEgressPlan:
    return "egress_plan";
  case Category::kStructuralPlans:
    return "structural_plans";
  case Category::kCommodities:
    return "commodities";
  case Category::kFireProtection:
    return "fire_protection";
  case Category::kSpecialInspection:
    return "special_inspection";
  case Category::kCoverLetter:
    return "cover_letter";
  case Category::kOther:
    return "other";
  }
  return "other";
}

const char* ToString(Status status) {
  switch (status) {
  case Status::kNotSubmitted:
    return "not_submitted";
  case Status::kPendingReview:
    return "pending_review";
  case Status::kApproved:
    return "approved";
  case Status::kRejected:
    return "rejected";
  }
  return "not_submitted";
}

Category ParseCategory(std::string_view name) {
  if (name == "site_plan") {
    return Category::kSitePlan;
  }
  if (name == "facility_plan") {
    return Category::kFacilityPlan;
  }
  if (name == "egress_plan") {
    return Category::kEgressPlan;
  }
  if (name == "structural_plans" || name == "structural_analysis") {
    return Category::kStructuralPlans;
  }
  if (name == "commodities") {
    return Category::kCommodities;
  }
  if (name == "fire_protection") {
    return Category::kFireProtection;
  }
  if (name == "special_inspection") {
    return Category::kSpecialInspection;
  }
  if (name == "cover_letter") {
    return Category::kCoverLetter;
  }
  return Category::kOther;
}

bool ParseStatus(std::string_view name, Status& status) {
  if (name == "not_submitted") {
    status = Status::kNotSubmitted;
    return true;
  }
  if (name == "pending_review") {
    status = Status::kPendingReview;
    return true;
  }
  if (name == "approved") {
    status = Status::kApproved;
    return true;
  }
  if (name == "rejected") {
    status = Status::kRejected;
    return true;
  }
  return false;
}

bool IsRequiredCategory(Category category) {
  return std::find(kRequiredCategories.begin(), kRequiredCategories.end(), category) !=
         kRequiredCategories.end();
}

std::string DisplayName(Category category) {
  std::string display;
  bool word_start = true;
  for (const char c : std::string_view(ToString(category))) {
    if (c == '_') {
      display.push_back(' ');
      word_start = true;
      continue;
    }
    const auto as_unsigned = static_cast<unsigned char>(c);
    display.push_back(word_start ? static_cast<char>(std::toupper(as_unsigned)) : c);
    word_start = false;
  }
  return display;
}

const char* CategoryDescription(Category category) {
  switch (category) {
  case Category::kSitePlan:
    return "Dimensioned site plan showing streets, building location, fire hydrants, and fire "
           "department access roadways.";
  case Category::kFacilityPlan:
    return "Dimensioned floor plan showing proposed and existing racking, fire department "
           "access doors, etc.";
  case Category::kEgressPlan:
    return "Floor plan showing means of egress components (aisles, exit access doors, exit "
           "doors, etc).";
  case Category::kStructuralPlans:
    return "Racking plan, shelf dimensions, structural calculations stamped by a licensed "
           "engineer.";
  case Category::kCommodities:
    return "Description of commodities stored and their placement method.";
  case Category::kFireProtection:
    return "Information about existing fire protection systems including type of sprinkler "
           "system.";
  case Category::kSpecialInspection:
    return "Special Inspection Agreement with 'Storage Racks' marked as requiring inspection.";
  case Category::kCoverLetter:
    return "Auto-generated comprehensive overview for municipal submission.";
  case Category::kOther:
    break;
  }
  return "Document for High-Piled Storage Permit";
}

} // namespace permitpack::documents
