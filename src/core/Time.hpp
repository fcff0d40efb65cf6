// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <string>
#include <string_view>

namespace callscribe
{

using SystemClock = std::chrono::system_clock;

/// @brief Wall-clock instant with microsecond precision, always UTC.
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/// @brief Returns the current UTC time truncated to microseconds.
[[nodiscard]] auto nowUtc() -> Timestamp;

/// @brief Formats an instant as ISO-8601 with microseconds and an explicit UTC offset,
/// e.g. "2024-01-01T10:00:00.000000+00:00".
[[nodiscard]] auto formatIso8601(SystemClock::time_point instant) -> std::string;

/// @brief Parses "YYYY-MM-DDTHH:MM:SS[.ffffff](Z|+00:00|+HH:MM|-HH:MM)".
///
/// A missing offset is read as UTC.
[[nodiscard]] auto parseIso8601(std::string_view text) -> Result<Timestamp>;

} // namespace callscribe
