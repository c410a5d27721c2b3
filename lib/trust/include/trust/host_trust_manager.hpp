#pragma once

#include <concepts/http_client.hpp>
#include <platform/time_utils.hpp>
#include <transport/http_types.hpp>
#include <transport/url.hpp>
#include <trust/registry_messages.hpp>

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <fmt/format.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace openlink_relay::trust {

/**
 * @brief Client of the central trust registry.
 *
 * Reports, ban queries and administrative actions are forwarded to the registry,
 * which owns report counts and bans for every relay. Registry failures never
 * propagate: reports fail with an error, ban checks answer "not banned", counts
 * answer 0.
 *
 * @tparam HttpClient Type satisfying concepts::http_client
 */
template<concepts::http_client HttpClient> class host_trust_manager
{
public:
  host_trust_manager(std::shared_ptr<HttpClient> client,
    registry_options options = {},
    platform::wall_clock_t clock = platform::system_wall_clock())
    : client_(std::move(client)), options_(std::move(options)), clock_(std::move(clock))
  {}

  /**
   * @brief Reports a public host as untrustworthy.
   *
   * @param host_url Relay URL being reported
   * @param reporter_id Identifier of the reporting machine
   * @param reason Free-form reason
   * @return Awaitable yielding the registry's verdict
   */
  auto report_host(std::string host_url, std::string reporter_id, std::string reason)
    -> boost::asio::awaitable<report_result>
  {
    const nlohmann::json payload = {
      { "hostUrl", host_url },
      { "reporterId", reporter_id },
      { "reason", reason },
      { "timestamp", now_millis() },
      { "action", "report" },
      { "threshold", options_.report_threshold },
      { "banDurationHours", options_.ban_duration.count() },
    };

    auto result = co_await post(options_.report_endpoint, payload);
    if (result.success) {
      spdlog::info("[host_trust_manager] Host reported: {}, reason: {}", host_url, reason);
    } else {
      spdlog::warn("[host_trust_manager] Report for {} failed: {}", host_url, result.error.value_or("unknown"));
    }
    co_return result;
  }

  /**
   * @brief Asks the registry whether a host is banned.
   *
   * @return Awaitable yielding the status; not banned with error set on failure
   */
  auto check_host_ban_status(std::string host_url) -> boost::asio::awaitable<ban_status>
  {
    auto body = co_await get(options_.status_endpoint, host_url);
    if (not body) { co_return ban_status{ .banned = false, .expires_at = {}, .reason = {}, .error = "registry unavailable" }; }
    co_return parse_ban_status(*body);
  }

  /**
   * @brief Number of reports the registry holds for a host, 0 on failure.
   */
  auto get_host_report_count(std::string host_url) -> boost::asio::awaitable<std::uint32_t>
  {
    auto body = co_await get(options_.reports_endpoint, host_url);
    co_return body ? parse_report_count(*body) : 0;
  }

  /**
   * @brief Lists a public relay in the registry.
   */
  auto register_public_host(host_registration registration) -> boost::asio::awaitable<report_result>
  {
    nlohmann::json payload = {
      { "name", registration.name },
      { "url", registration.url },
      { "features", registration.features },
      { "region", registration.region },
    };
    if (registration.public_key) { payload["publicKey"] = *registration.public_key; }

    auto result = co_await post(options_.register_endpoint, payload);
    if (result.success) { spdlog::info("[host_trust_manager] Registered {} as public host", registration.url); }
    co_return result;
  }

  /**
   * @brief Lifts a ban (administrative action, authorized by the registry).
   */
  auto unban_host(std::string host_url, std::string admin_token) -> boost::asio::awaitable<report_result>
  {
    const nlohmann::json payload = {
      { "action", "unban" },
      { "hostUrl", host_url },
      { "adminToken", admin_token },
      { "timestamp", now_millis() },
    };
    auto result = co_await post(options_.report_endpoint, payload);
    if (result.success) { spdlog::info("[host_trust_manager] Host unbanned: {}", host_url); }
    co_return result;
  }

  [[nodiscard]] auto options() const -> const registry_options & { return options_; }

private:
  auto now_millis() const -> std::uint64_t { return platform::to_unix_millis(clock_()); }

  auto post(const std::string &endpoint, const nlohmann::json &payload) -> boost::asio::awaitable<report_result>
  {
    std::string failure;
    try {
      const auto response = co_await client_->request(transport::http_request{ .method = transport::http_method::post,
        .url = endpoint,
        .headers = { { "Content-Type", "application/json" }, { "Accept", "application/json" } },
        .body = payload.dump(),
        .timeout = options_.timeout });
      co_return parse_report_reply(response.status, response.body);
    } catch (const std::exception &err) {
      failure = err.what();
    }
    spdlog::warn("[host_trust_manager] Registry request to {} failed: {}", endpoint, failure);
    co_return report_result{ .success = false, .total_reports = {}, .action_taken = {}, .error = failure };
  }

  auto get(const std::string &endpoint, const std::string &host_url) -> boost::asio::awaitable<std::optional<std::string>>
  {
    static constexpr unsigned status_ok = 200;

    std::string failure;
    try {
      const auto response = co_await client_->request(transport::http_request{ .method = transport::http_method::get,
        .url = fmt::format("{}?url={}", endpoint, transport::url_encode(host_url)),
        .headers = { { "Accept", "application/json" } },
        .body = {},
        .timeout = options_.timeout });
      if (response.status == status_ok) { co_return response.body; }
      failure = fmt::format("HTTP {}", response.status);
    } catch (const std::exception &err) {
      failure = err.what();
    }
    spdlog::warn("[host_trust_manager] Registry query {} for {} failed: {}", endpoint, host_url, failure);
    co_return std::nullopt;
  }

  std::shared_ptr<HttpClient> client_;
  registry_options options_;
  platform::wall_clock_t clock_;
};

}// namespace openlink_relay::trust
