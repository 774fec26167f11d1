#include "ragsync/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace ragsync::common {

std::int64_t to_unix_ms(const TimePoint time) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint from_unix_ms(const std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::int64_t now_unix_ms() { return to_unix_ms(std::chrono::system_clock::now()); }

std::string format_rfc3339(const TimePoint time) {
  const auto t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  gmtime_r(&t, &tm);

  auto millis = to_unix_ms(time) % 1000;
  if (millis < 0) {
    millis += 1000;
  }

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

std::string format_rfc3339(const std::optional<TimePoint> &time, const std::string &absent) {
  return time.has_value() ? format_rfc3339(*time) : absent;
}

} // namespace ragsync::common
