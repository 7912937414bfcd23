#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fitbridge {
namespace stringutil {

// Trim leading and trailing whitespace from a string
std::string trim(std::string_view str);

std::string join(const std::vector<std::string> &parts, std::string_view sep);

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view value);

/**
 * True when value is a YYYY-MM-DD calendar date that actually exists
 * (2024-02-30 is rejected).
 */
bool is_calendar_date(std::string_view value);

// First n characters followed by "..." for console display of secrets.
std::string redact(std::string_view secret, std::size_t keep = 6);

} // namespace stringutil
} // namespace fitbridge
