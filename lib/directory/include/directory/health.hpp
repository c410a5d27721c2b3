#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace openlink_relay::directory {

/// Outcome class of a single health probe
enum class health_status : std::uint8_t { online, degraded, offline, timeout, error };

/**
 * @brief Result of probing one server's /health endpoint.
 */
struct health_result
{
  health_status status{ health_status::error };///< Classified outcome
  std::optional<std::uint32_t> latency_ms;///< Round trip when a response arrived
  bool online{};///< True only for health_status::online
  std::optional<std::string> error;///< Failure text for health_status::error
};

[[nodiscard]] auto to_string(health_status status) -> std::string_view;

/**
 * @brief Maps a relay URL to its HTTP health endpoint.
 *
 * ws:// becomes http://, wss:// becomes https://; host and port are kept and the
 * path is replaced by /health.
 *
 * @param server_url Relay WebSocket URL
 * @return Health URL, or std::nullopt if server_url is not a ws(s) URL
 */
[[nodiscard]] auto health_url(std::string_view server_url) -> std::optional<std::string>;

}// namespace openlink_relay::directory
