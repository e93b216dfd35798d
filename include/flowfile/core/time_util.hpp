#pragma once

#include <ctime>
#include <optional>
#include <string>

namespace flowfile {

/// UTC timestamp as "2006-01-02T15:04:05Z".
std::string format_rfc3339(std::time_t t);

/// Parses "YYYY-MM-DDTHH:MM:SS" followed by "Z" or a "+hh:mm"/"-hh:mm" offset.
std::optional<std::time_t> parse_rfc3339(const std::string& text);

} // namespace flowfile
