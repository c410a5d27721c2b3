#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace openlink_relay::platform {

/// Wall-clock source, injectable so time-driven logic stays deterministic under test.
using wall_clock_t = std::function<std::chrono::system_clock::time_point()>;

/// Monotonic clock source used for latency measurement.
using steady_clock_t = std::function<std::chrono::steady_clock::time_point()>;

[[nodiscard]] auto system_wall_clock() -> wall_clock_t;

[[nodiscard]] auto system_steady_clock() -> steady_clock_t;

/**
 * @brief Milliseconds since the Unix epoch.
 *
 * @param time_point Wall-clock time
 * @return Epoch milliseconds
 */
[[nodiscard]] auto to_unix_millis(std::chrono::system_clock::time_point time_point) -> std::uint64_t;

/**
 * @brief Formats a wall-clock time as ISO-8601 UTC (e.g. "2024-01-31T12:00:00Z").
 *
 * @param time_point Wall-clock time
 * @return Formatted timestamp
 */
[[nodiscard]] auto format_iso8601(std::chrono::system_clock::time_point time_point) -> std::string;

}// namespace openlink_relay::platform
