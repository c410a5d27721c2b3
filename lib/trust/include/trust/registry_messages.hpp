#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace openlink_relay::trust {

/**
 * @brief Central registry endpoints and the ban policy echoed in reports.
 */
struct registry_options
{
  std::string report_endpoint{ "https://raywonderis.me/openlink/api/report-host" };
  std::string status_endpoint{ "https://raywonderis.me/openlink/api/host-status" };
  std::string reports_endpoint{ "https://raywonderis.me/openlink/api/host-reports" };
  std::string register_endpoint{ "https://raywonderis.me/openlink/register-host" };
  std::uint32_t report_threshold{ 3 };///< Reports that trigger an alert and ban
  std::chrono::hours ban_duration{ 24 };
  std::chrono::milliseconds timeout{ std::chrono::seconds(10) };
};

/**
 * @brief Registry reply to a report or an administrative action.
 */
struct report_result
{
  bool success{};
  std::optional<std::uint32_t> total_reports;
  std::optional<std::string> action_taken;///< e.g. "logged", "banned_and_alerted"
  std::optional<std::string> error;
};

struct ban_status
{
  bool banned{};
  std::optional<std::uint64_t> expires_at;///< Epoch milliseconds
  std::optional<std::string> reason;
  std::optional<std::string> error;///< Set when the registry could not be queried
};

/**
 * @brief Announcement of a public relay to the registry.
 */
struct host_registration
{
  std::string name;
  std::string url;
  std::string region;
  std::vector<std::string> features{ "signaling", "relay", "turn" };
  std::optional<std::string> public_key;
};

/**
 * @brief Interprets a registry reply body.
 *
 * Non-JSON bodies fall back to success iff the status was 200.
 */
[[nodiscard]] auto parse_report_reply(unsigned status, const std::string &body) -> report_result;

/**
 * @brief Interprets a host-status reply body.
 *
 * @return The status, with error set and banned false if the body is unreadable
 */
[[nodiscard]] auto parse_ban_status(const std::string &body) -> ban_status;

/**
 * @brief Extracts "count" from a host-reports reply, 0 when absent or malformed.
 */
[[nodiscard]] auto parse_report_count(const std::string &body) -> std::uint32_t;

}// namespace openlink_relay::trust
