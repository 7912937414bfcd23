#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <date/date.h>

#include "result_monad.hpp"

namespace fitbridge::tcx {

using TimePoint = date::sys_time<std::chrono::nanoseconds>;

/**
 * Strict RFC 3339: YYYY-MM-DDTHH:MM:SS[.fraction](Z|+hh:mm|-hh:mm).
 * The result is the instant in UTC. Anything else, including the empty
 * string, is TCX::TIMESTAMP_PARSE_ERROR.
 */
monad::MyResult<TimePoint> parse_rfc3339(std::string_view timestamp);

// YYYY-MM-DDTHH:MM:SSZ, fractional seconds truncated.
std::string format_utc_seconds(TimePoint tp);

/**
 * Parses `timestamp`, shifts it by `offset` (which may be zero or negative)
 * and formats the result in UTC with second precision.
 *
 *   convert_timestamp("2024-01-01T10:00:00Z", 30s)      -> 2024-01-01T10:00:30Z
 *   convert_timestamp("2024-01-01T12:00:00+02:00", 0s)  -> 2024-01-01T10:00:00Z
 */
monad::MyResult<std::string> convert_timestamp(std::string_view timestamp,
                                               std::chrono::milliseconds offset);

} // namespace fitbridge::tcx
