#pragma once

#include "core/logging/logger.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace permitpack::narrative {

// Semantic role of one narrative line; drives the paragraph style.
enum class LineRole {
  kHeader,
  kDate,
  kSubject,
  kSalutation,
  kCategoryHeading,
  kFilesHeader,
  kFileEntry,
  kContactLabelValue,
  kClosing,
  kFooter,
  kBody,
};

struct ClassifiedLine {
  LineRole role = LineRole::kBody;
  std::string text;
  int raw_index = 0;
};

// Fixed strings the classifier matches against. Defaults are the letterhead
// and signature the submission service prints; config may override them.
struct ClassifierProfile {
  std::string letterhead = "Intralog Permit Services";
  std::string signature_phrase = "Permit Services Team";
  std::string footer_prefix = "Generated by PainlessPermit";
};

const char* ToString(LineRole role);

// Accepts the snake_case names produced by ToString. Used for structured
// narratives that arrive already tagged.
bool ParseLineRole(std::string_view name, LineRole& role);

// Strips emphasis markers (`**`, `<b>`, `</b>`), `&nbsp;` entities, `---`
// separators and "(N copies)" groups, then trims. Applied until nothing
// changes, so NormalizeLine(NormalizeLine(x)) == NormalizeLine(x).
std::string NormalizeLine(std::string_view raw);

// True when the line, after marker stripping but before trimming, starts
// with a space or tab.
bool HasLeadingIndent(std::string_view raw);

// Classifies one raw line. Returns nullopt when the line is blank after
// normalization; the renderer turns the gap into a spacer paragraph.
std::optional<ClassifiedLine> ClassifyLine(std::string_view raw, int raw_index,
                                           const ClassifierProfile& profile = {});

// Classifies every line of a flat narrative. Output keeps input order and
// each entry's raw_index points back at its source line. Lines that fall
// through to `body` are logged at debug level when a logger is supplied.
std::vector<ClassifiedLine> ClassifyLines(const std::vector<std::string>& lines,
                                          const ClassifierProfile& profile = {},
                                          core::logging::Logger* logger = nullptr);

} // namespace permitpack::narrative
