#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace kbsync::util {

TimePoint Now() {
  return Clock::now();
}

std::string FormatTimestamp(TimePoint tp) {
  const auto secs   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto       micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
  if (micros < 0) micros = 0;

  const std::time_t t = Clock::to_time_t(secs);
  std::tm           utc{};
  gmtime_r(&t, &utc);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%06lld", utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday, utc.tm_hour,
                utc.tm_min, utc.tm_sec, static_cast<long long>(micros));
  return buf;
}

std::optional<TimePoint> ParseTimestamp(std::string_view text) {
  if (text.empty()) return std::nullopt;

  std::string owned(text);
  std::tm     utc{};
  int         frac_len = 0;
  char        frac[16] = {0};

  // "T" separator accepted for values written by other tools.
  const int fields = std::sscanf(owned.c_str(), "%4d-%2d-%2d%*[ T]%2d:%2d:%2d%n", &utc.tm_year, &utc.tm_mon, &utc.tm_mday, &utc.tm_hour,
                                 &utc.tm_min, &utc.tm_sec, &frac_len);
  if (fields != 6) return std::nullopt;

  long long micros = 0;
  if (static_cast<std::size_t>(frac_len) < owned.size() && owned[frac_len] == '.') {
    if (std::sscanf(owned.c_str() + frac_len + 1, "%6[0-9]", frac) == 1) {
      std::string digits(frac);
      digits.resize(6, '0');
      micros = std::stoll(digits);
    }
  }

  utc.tm_year -= 1900;
  utc.tm_mon -= 1;
  const std::time_t t = timegm(&utc);
  if (t == static_cast<std::time_t>(-1)) return std::nullopt;

  return Clock::from_time_t(t) + std::chrono::microseconds(micros);
}

double ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace kbsync::util
