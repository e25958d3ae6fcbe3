#pragma once

#include "narrative/line_classifier.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace permitpack::narrative {

// Parses a pre-tagged narrative: a JSON array of {"role": ..., "text": ...}.
//
// Contract:
// - element i becomes a line with raw_index i; elements whose text is blank
//   are dropped (the renderer emits a spacer for the gap).
// - text is normalized exactly like flat narrative lines.
// - a role name that is missing or unknown falls back to `body`; the names
//   are collected in `unknown_roles` so callers can log them.
// - returns false with an error naming the element index when the document
//   is not an array of objects or an element lacks a string `text`.
bool ParseStructuredNarrative(std::string_view json_text, std::vector<ClassifiedLine>& lines,
                              std::vector<std::string>& unknown_roles, std::string& error);

} // namespace permitpack::narrative
