#pragma once

#include <access/password.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace openlink_relay::access {

/// How connecting clients prove they may use the relay
enum class access_mode : std::uint8_t { public_access, pin, password, two_factor, whitelist };

/// Wire and persisted name ("public", "pin", "password", "2fa", "whitelist")
[[nodiscard]] auto to_string(access_mode mode) -> std::string_view;

/// Accepts the wire names plus "two-factor"
[[nodiscard]] auto parse_access_mode(std::string_view text) -> std::optional<access_mode>;

/**
 * @brief Host-side PIN required from every connecting user, independent of the access mode.
 */
struct connection_pin_config
{
  bool required{};
  std::string value;///< 4-8 digits
  std::optional<std::chrono::system_clock::time_point> expires_at;///< No expiry when empty
  bool one_time{};///< Replace the PIN after each successful use
};

/**
 * @brief Access configuration of one relay host.
 */
struct access_config
{
  bool is_public{ true };///< Advertised as a public relay; drives the startup warning
  access_mode mode{ access_mode::public_access };
  std::optional<std::string> host_name;///< Shown to clients in auth-required
  std::size_t max_connections{ 100 };
  std::size_t max_sessions_per_client{ 5 };///< Sessions one connection may host
  std::optional<std::string> pin_code;
  std::optional<password_digest> password;
  std::optional<std::string> totp_secret;///< Base32
  bool two_factor_enabled{};
  std::vector<std::string> allowed_ips;
  std::vector<std::string> denied_ips;
  connection_pin_config connection_pin;
  bool public_warning_shown{};
};

[[nodiscard]] auto to_json(const access_config &config) -> nlohmann::json;

/**
 * @brief Reads a persisted configuration; missing fields keep their defaults.
 */
[[nodiscard]] auto access_config_from_json(const nlohmann::json &json) -> access_config;

}// namespace openlink_relay::access
