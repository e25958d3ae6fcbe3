#pragma once

#include "documents/document_model.hpp"
#include "narrative/line_classifier.hpp"

#include <string>
#include <vector>

namespace permitpack::narrative {

struct TemplateInputs {
  documents::ProjectInfo project;
  std::vector<documents::DocumentRecord> documents;
  // Already formatted, e.g. "October 19, 2026".
  std::string letter_date;
};

// Deterministic cover letter used when no generated narrative is supplied.
//
// Layout: letterhead, date, addressee block, subject, salutation, opening
// paragraph, one numbered heading per category present (package order)
// followed by "Files Submitted:" and four-space indented file names, contact
// lines, "Sincerely,", signature and footer. Cover letter records are not
// listed. Every line is written so ClassifyLines assigns the intended role.
std::vector<std::string> BuildTemplateNarrative(const TemplateInputs& inputs,
                                                const ClassifierProfile& profile = {});

} // namespace permitpack::narrative
