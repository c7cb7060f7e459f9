#pragma once

#include <chrono>
#include <string>

namespace envkeeper {
namespace common {

using TimePoint = std::chrono::system_clock::time_point;

// UTC "YYYY-mm-ddTHH:MM:SSZ"
std::string format_rfc3339(TimePoint tp);

// Accepts "YYYY-mm-ddTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]" and the SQLite
// "YYYY-mm-dd HH:MM:SS" variant. Returns false on anything else.
bool parse_rfc3339(const std::string &text, TimePoint &out);

// Compact form used in file names: "YYYYmmddTHHMMSSZ"
std::string compact_utc_stamp(TimePoint tp);

// Legacy caches write "" for "never"; the relational schema wants a date
std::string date_or_epoch(const std::string &text);

}  // namespace common
}  // namespace envkeeper
