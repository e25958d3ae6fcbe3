#pragma once

#include <string>
#include <string_view>

namespace permitpack::narrative {

// Values substituted for bracketed placeholders a generator left behind.
struct ContactDefaults {
  std::string contact_name = "Intralog Permit Services Team";
  std::string street_address = "123 Permit Way, Suite 100";
  std::string city_state_zip = "Phoenix, AZ 85001";
  std::string email = "permits@intralog.com";
  std::string phone = "(800) 555-1234";
  std::string organization = "Intralog Permit Services";
  // Substituted for [Date]-style placeholders; FillPlaceholders leaves date
  // placeholders alone when this is empty.
  std::string letter_date;
};

// Replaces every `[...]` group (shortest match, no nesting) by keyword,
// checked case-insensitively in this order: name/contact, address,
// city/state/zip, email, phone, date, anything else -> organization.
// A `[` left unclosed on its own line is copied through.
std::string FillPlaceholders(std::string_view text, const ContactDefaults& defaults);

} // namespace permitpack::narrative
