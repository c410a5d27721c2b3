#include <trust/registry_messages.hpp>

#include <nlohmann/json.hpp>

namespace openlink_relay::trust {

namespace {

  constexpr unsigned status_ok = 200;

}// namespace

auto parse_report_reply(unsigned status, const std::string &body) -> report_result
{
  report_result result;
  const auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() or not json.is_object()) {
    result.success = status == status_ok;
    if (not result.success) { result.error = "HTTP " + std::to_string(status); }
    return result;
  }

  result.success = json.contains("success") and json["success"].is_boolean() ? json["success"].get<bool>()
                                                                               : status == status_ok;
  if (json.contains("totalReports") and json["totalReports"].is_number_unsigned()) {
    result.total_reports = json["totalReports"].get<std::uint32_t>();
  }
  if (json.contains("actionTaken") and json["actionTaken"].is_string()) {
    result.action_taken = json["actionTaken"].get<std::string>();
  }
  if (json.contains("error") and json["error"].is_string()) { result.error = json["error"].get<std::string>(); }
  return result;
}

auto parse_ban_status(const std::string &body) -> ban_status
{
  ban_status status;
  const auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() or not json.is_object()) {
    status.error = "malformed registry reply";
    return status;
  }

  status.banned = json.contains("banned") and json["banned"].is_boolean() and json["banned"].get<bool>();
  if (json.contains("expiresAt") and json["expiresAt"].is_number_unsigned()) {
    status.expires_at = json["expiresAt"].get<std::uint64_t>();
  }
  if (json.contains("reason") and json["reason"].is_string()) { status.reason = json["reason"].get<std::string>(); }
  return status;
}

auto parse_report_count(const std::string &body) -> std::uint32_t
{
  const auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() or not json.is_object() or not json.contains("count")
      or not json["count"].is_number_unsigned()) {
    return 0;
  }
  return json["count"].get<std::uint32_t>();
}

}// namespace openlink_relay::trust
