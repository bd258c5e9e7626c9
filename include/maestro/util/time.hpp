#pragma once

#include "maestro/core/error.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace maestro {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// "2026-01-21T17:59:23Z"
[[nodiscard]] auto format_iso8601(TimePoint tp) -> std::string;

// "20260121-175923", local time; used for container names and run log files.
[[nodiscard]] auto format_compact_local(TimePoint tp) -> std::string;

// "container-<image>-20260121-175923". Characters a runtime rejects in
// container names are replaced with '_'.
[[nodiscard]] auto container_name_for(std::string_view image, TimePoint tp)
    -> std::string;

// Parses RFC 3339 timestamps as reported by container runtimes, including
// fractional seconds and numeric offsets ("2026-01-21T17:59:23.5+01:00").
[[nodiscard]] auto parse_rfc3339(std::string_view text) -> Result<TimePoint>;

}  // namespace maestro
