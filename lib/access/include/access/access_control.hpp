#pragma once

#include <access/access_config.hpp>
#include <platform/time_utils.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace openlink_relay::access {

/**
 * @brief Credentials carried by an authenticate message.
 */
struct auth_data
{
  std::optional<std::string> pin;
  std::optional<std::string> password;
  std::optional<std::string> totp_code;
  std::optional<std::string> connection_pin;
};

/**
 * @brief Verdict of a credential check.
 */
struct auth_result
{
  bool allowed{};
  std::string reason;///< Deny reason sent to the client, empty when allowed
};

/**
 * @brief Outcome of an operator action.
 */
struct operation_result
{
  bool success{};
  std::optional<std::string> error;
};

/**
 * @brief Secret and provisioning URL returned by enable_2fa().
 */
struct two_factor_setup
{
  std::string secret;///< Base32 secret
  std::string otpauth_url;///< otpauth://totp/... for authenticator apps
};

struct connection_pin_options
{
  bool one_time{};
  std::optional<std::chrono::minutes> expiry;
};

/**
 * @brief Connection PIN state after a set or generate.
 */
struct connection_pin_result
{
  bool success{};
  std::optional<std::string> error;
  std::string pin;
  std::optional<std::chrono::system_clock::time_point> expires_at;
  bool one_time{};
};

/**
 * @brief Access modes, IP lists and the connection PIN of one relay host.
 *
 * All operations are thread-safe. Only operator actions mutate; verification is
 * read-only except for one-time connection PIN rotation.
 */
class access_control
{
public:
  /// Digits of the PIN produced by generate_connection_pin() by default
  static constexpr std::size_t default_pin_digits{ 6 };

  /// Receives the replacement PIN and the configuration holding it
  using pin_rotation_observer = std::function<void(const std::string &, const access_config &)>;

  explicit access_control(access_config config = {}, platform::wall_clock_t clock = platform::system_wall_clock());

  /**
   * @brief Checks credentials from a connecting client.
   *
   * Deny list first, then the mode: whitelist, public, pin, password, two-factor
   * (password when configured, then a TOTP code within one step of now).
   *
   * @param credentials Submitted credentials
   * @param client_ip Remote address of the client
   * @return allowed, or the deny reason
   */
  [[nodiscard]] auto verify(const auth_data &credentials, std::string_view client_ip) const -> auth_result;

  /**
   * @brief Checks the host-side connection PIN, if one is required.
   *
   * Expiry is checked before equality. A one-time PIN is replaced by a fresh
   * PIN of the same length after a successful use.
   */
  auto verify_connection_pin(std::string_view pin) -> auth_result;

  /**
   * @brief Registers the callback run after a one-time connection PIN rotates.
   *
   * The callback runs on the verifying thread with no lock held.
   */
  auto on_connection_pin_rotated(pin_rotation_observer observer) -> void;

  [[nodiscard]] auto connection_pin_required() const -> bool;

  /// True if a client from this IP is authenticated on connect
  [[nodiscard]] auto admits_without_credentials(std::string_view client_ip) const -> bool;

  /// Sets the PIN (4-8 digits) and switches to pin mode
  auto set_pin_code(const std::string &pin) -> operation_result;

  /// Stores a digest of the password (at least 4 characters) and switches to password mode
  auto set_password(std::string_view password) -> operation_result;

  /// Generates a fresh 20-byte TOTP secret and switches to two-factor mode
  auto enable_2fa() -> two_factor_setup;

  /// Public mode; the startup warning is shown again on the next start
  auto set_public() -> void;

  auto set_private() -> void;

  /// Admits only allow-listed IPs
  auto set_whitelist_mode() -> void;

  auto set_connection_pin(const std::string &pin, connection_pin_options options = {}) -> connection_pin_result;

  auto generate_connection_pin(std::size_t digits = default_pin_digits, connection_pin_options options = {})
    -> connection_pin_result;

  auto clear_connection_pin() -> void;

  auto allow_ip(const std::string &client_ip) -> void;
  auto remove_allowed_ip(const std::string &client_ip) -> void;
  auto deny_ip(const std::string &client_ip) -> void;
  auto remove_denied_ip(const std::string &client_ip) -> void;

  auto set_host_name(std::optional<std::string> host_name) -> void;
  auto set_limits(std::size_t max_connections, std::size_t max_sessions_per_client) -> void;

  /**
   * @brief Claims the public-mode warning for this start.
   *
   * @return true exactly once per arming while the host is public
   */
  auto take_public_warning() -> bool;

  [[nodiscard]] auto config() const -> access_config;

private:
  auto apply_connection_pin(const std::string &pin, connection_pin_options options) -> connection_pin_result;

  [[nodiscard]] auto verify_totp_code(const std::optional<std::string> &code) const -> bool;

  mutable std::mutex mutex_;
  access_config config_;
  platform::wall_clock_t clock_;
  pin_rotation_observer rotation_observer_;
};

}// namespace openlink_relay::access
