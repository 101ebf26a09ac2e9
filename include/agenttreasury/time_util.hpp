#pragma once

#include "agenttreasury/types.hpp"
#include <string>

namespace agenttreasury {

std::int64_t to_unix_millis(Timestamp t);
Timestamp from_unix_millis(std::int64_t millis);

// Calendar day of `t` in a zone `utc_offset_minutes` east of UTC
LocalDate local_date(Timestamp t, std::int32_t utc_offset_minutes = 0);

// "YYYY-MM-DD"
std::string format_date(LocalDate date);

// Random (version 4) UUID string
std::string generate_uuid();

} // namespace agenttreasury
