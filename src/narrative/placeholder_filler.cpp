#include "narrative/placeholder_filler.hpp"

#include "core/text_utils.hpp"

namespace permitpack::narrative {

namespace {

const std::string* ReplacementFor(std::string_view placeholder, const ContactDefaults& defaults) {
  const std::string key = core::ToLower(placeholder);
  const auto has = [&key](std::string_view word) { return core::Contains(key, word); };

  if (has("name") || has("contact")) {
    return &defaults.contact_name;
  }
  if (has("address")) {
    return &defaults.street_address;
  }
  if (has("city") || has("state") || has("zip")) {
    return &defaults.city_state_zip;
  }
  if (has("email")) {
    return &defaults.email;
  }
  if (has("phone")) {
    return &defaults.phone;
  }
  if (has("date")) {
    return defaults.letter_date.empty() ? nullptr : &defaults.letter_date;
  }
  return &defaults.organization;
}

} // namespace

std::string FillPlaceholders(std::string_view text, const ContactDefaults& defaults) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t open = text.find('[', pos);
    if (open == std::string_view::npos) {
      break;
    }
    const std::size_t close = text.find(']', open + 1U);
    if (close == std::string_view::npos) {
      break;
    }
    out.append(text.substr(pos, open - pos));
    // Placeholders never span lines.
    const std::size_t newline = text.find('\n', open);
    if (newline < close) {
      out.append(text.substr(open, newline - open));
      pos = newline;
      continue;
    }
    const std::string_view placeholder = text.substr(open, close - open + 1U);
    const std::string* replacement = ReplacementFor(placeholder, defaults);
    out.append(replacement != nullptr ? std::string_view(*replacement) : placeholder);
    pos = close + 1U;
  }
  out.append(text.substr(pos));
  return out;
}

} // namespace permitpack::narrative
