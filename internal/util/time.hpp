#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace modeldb::util {

/*
  Time utilities. All clock reads go through Now().

  Timestamps are always UTC. The text form is the one PostgreSQL prints for
  TIMESTAMP columns and the one stored in SQLite TEXT columns:
    YYYY-MM-DD HH:MM:SS[.ffffff]
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

TimePoint FromUnixMillis(int64_t millis);
int64_t   ToUnixMillis(TimePoint tp);

// Microsecond precision, matches TIMESTAMP resolution in postgres.
std::string FormatTimestamp(TimePoint tp);

// Accepts 0-9 fractional digits and an optional 'T' separator.
std::optional<TimePoint> ParseTimestamp(const std::string& text);

} // namespace modeldb::util
