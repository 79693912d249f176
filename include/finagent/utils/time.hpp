#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace finagent::utils {

using Timestamp = std::chrono::system_clock::time_point;

void sleep_for(std::chrono::milliseconds duration);

double retry_jitter_factor();

std::chrono::milliseconds calculate_retry_delay(std::size_t attempt,
                                                std::optional<double> jitter_factor = std::nullopt);

/**
 * Converts (possibly fractional) seconds since the Unix epoch into a
 * Timestamp with microsecond precision. Non-finite values and values the
 * clock cannot represent yield std::nullopt.
 */
std::optional<Timestamp> from_unix_seconds(double seconds);

/**
 * Formats a Timestamp as ISO-8601 in UTC with an explicit offset, e.g.
 * `2023-11-14T22:13:20+00:00`. Sub-second precision is written as
 * microseconds only when non-zero.
 */
std::string format_iso8601_utc(Timestamp timestamp);

}  // namespace finagent::utils
