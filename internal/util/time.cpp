#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace modeldb::util {

TimePoint Now() {
  return Clock::now();
}

TimePoint FromUnixMillis(int64_t millis) {
  return TimePoint{} + std::chrono::milliseconds(millis);
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::string FormatTimestamp(TimePoint tp) {
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
  auto secs   = micros / 1000000;
  auto frac   = micros % 1000000;
  if (frac < 0) {
    frac += 1000000;
    secs -= 1;
  }

  std::time_t t = static_cast<std::time_t>(secs);
  std::tm     utc{};
  gmtime_r(&t, &utc);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%06lld", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<long long>(frac));
  return buf;
}

std::optional<TimePoint> ParseTimestamp(const std::string& text) {
  std::tm utc{};
  char    sep      = 0;
  int     consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &utc.tm_year, &utc.tm_mon, &utc.tm_mday, &sep, &utc.tm_hour,
                  &utc.tm_min, &utc.tm_sec, &consumed) != 7) {
    return std::nullopt;
  }
  if (sep != ' ' && sep != 'T') {
    return std::nullopt;
  }

  utc.tm_year -= 1900;
  utc.tm_mon -= 1;

  int64_t micros = 0;
  auto    pos    = static_cast<std::size_t>(consumed);
  if (pos < text.size() && text[pos] == '.') {
    int64_t scale = 100000;
    for (++pos; pos < text.size() && text[pos] >= '0' && text[pos] <= '9'; ++pos) {
      micros += (text[pos] - '0') * scale;
      scale /= 10;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  const std::time_t secs = timegm(&utc);
  return TimePoint{} + std::chrono::seconds(secs) + std::chrono::microseconds(micros);
}

} // namespace modeldb::util
