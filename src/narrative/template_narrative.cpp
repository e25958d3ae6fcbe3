#include "narrative/template_narrative.hpp"

#include "documents/category_order.hpp"

#include <algorithm>

namespace permitpack::narrative {

namespace {

std::string OrDefault(const std::string& value, const char* fallback) {
  return value.empty() ? std::string(fallback) : value;
}

} // namespace

std::vector<std::string> BuildTemplateNarrative(const TemplateInputs& inputs,
                                                const ClassifierProfile& profile) {
  const auto& project = inputs.project;
  const std::string project_name = OrDefault(project.name, "the facility");

  std::vector<documents::DocumentRecord> listed;
  for (const auto& document : inputs.documents) {
    if (document.category != documents::Category::kCoverLetter) {
      listed.push_back(document);
    }
  }
  std::sort(listed.begin(), listed.end(), documents::ComparePackageOrder);

  std::vector<std::string> lines;
  lines.push_back(profile.letterhead);
  lines.push_back(inputs.letter_date);
  lines.emplace_back();
  lines.push_back(OrDefault(project.jurisdiction, "Local Authority Having Jurisdiction"));
  if (!project.facility_address.empty()) {
    lines.push_back("Facility Address: " + project.facility_address);
  }
  lines.emplace_back();
  lines.push_back("Subject: High-Piled Storage Permit Application for " + project_name);
  lines.push_back("Permit Number: " + OrDefault(project.permit_number, "To be assigned"));
  lines.emplace_back();
  lines.push_back("Dear Plan Review Staff,");
  lines.emplace_back();
  lines.push_back("Please find enclosed the complete set of documents for the High-Piled Storage "
                  "Permit application for " +
                  project_name + ". The documents are organized by category below.");

  int heading_number = 0;
  for (std::size_t i = 0; i < listed.size(); ++i) {
    const bool new_category = i == 0U || listed[i].category != listed[i - 1U].category;
    if (new_category) {
      lines.emplace_back();
      lines.push_back(std::to_string(++heading_number) + ". " +
                      documents::DisplayName(listed[i].category));
      lines.push_back("Files Submitted:");
    }
    lines.push_back("    " + listed[i].file_name);
  }

  lines.emplace_back();
  lines.push_back("If you require any additional information or clarification, please contact "
                  "us at your earliest convenience.");
  if (!project.contact_email.empty()) {
    lines.push_back("Email: " + project.contact_email);
  }
  if (!project.contact_phone.empty()) {
    lines.push_back("Phone: " + project.contact_phone);
  }
  lines.emplace_back();
  lines.push_back("Sincerely,");
  lines.push_back(profile.signature_phrase);
  lines.emplace_back();
  lines.push_back(profile.footer_prefix);
  return lines;
}

} // namespace permitpack::narrative
