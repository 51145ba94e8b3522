#pragma once

#include <string_view>

namespace jtdv::validation {

// True when `text` is an RFC 3339 `date-time`, e.g. 1985-04-12T23:20:50.52Z.
// Calendar ranges are checked (including leap years); second 60 is accepted
// for leap seconds. The date/time separator may be `T` or `t`, the UTC
// designator `Z` or `z`.
bool IsRfc3339Timestamp(std::string_view text);

} // namespace jtdv::validation
