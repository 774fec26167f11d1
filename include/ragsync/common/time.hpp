#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ragsync::common {

using TimePoint = std::chrono::system_clock::time_point;

[[nodiscard]] std::int64_t to_unix_ms(TimePoint time);
[[nodiscard]] TimePoint from_unix_ms(std::int64_t ms);
[[nodiscard]] std::int64_t now_unix_ms();

/// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
[[nodiscard]] std::string format_rfc3339(TimePoint time);
[[nodiscard]] std::string format_rfc3339(const std::optional<TimePoint> &time,
                                         const std::string &absent = "never");

} // namespace ragsync::common
