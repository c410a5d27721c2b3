#include <access/access_control.hpp>
#include <access/base32.hpp>
#include <access/totp.hpp>
#include <core/secure_random.hpp>

#include <algorithm>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace openlink_relay::access {

namespace {

  constexpr std::size_t min_pin_digits = 4;
  constexpr std::size_t max_pin_digits = 8;
  constexpr std::size_t min_password_length = 4;
  constexpr std::size_t totp_secret_bytes = 20;

  auto is_valid_pin(std::string_view pin) -> bool
  {
    return pin.size() >= min_pin_digits and pin.size() <= max_pin_digits
           and std::ranges::all_of(pin, [](char digit) { return digit >= '0' and digit <= '9'; });
  }

  auto contains(const std::vector<std::string> &list, std::string_view value) -> bool
  {
    return std::ranges::find(list, value) != list.end();
  }

  auto deny(std::string reason) -> auth_result { return { .allowed = false, .reason = std::move(reason) }; }

  auto allow() -> auth_result { return { .allowed = true, .reason = {} }; }

  auto add_unique(std::vector<std::string> &list, const std::string &value) -> void
  {
    if (not contains(list, value)) { list.push_back(value); }
  }

}// namespace

access_control::access_control(access_config config, platform::wall_clock_t clock)
  : config_(std::move(config)), clock_(std::move(clock))
{}

auto access_control::verify(const auth_data &credentials, std::string_view client_ip) const -> auth_result
{
  const std::scoped_lock lock(mutex_);

  if (contains(config_.denied_ips, client_ip)) { return deny("IP blocked"); }

  switch (config_.mode) {
  case access_mode::whitelist:
    return contains(config_.allowed_ips, client_ip) ? allow() : deny("IP not whitelisted");
  case access_mode::public_access:
    return allow();
  case access_mode::pin:
    if (config_.pin_code and credentials.pin == config_.pin_code) { return allow(); }
    return deny("Invalid PIN");
  case access_mode::password:
    if (config_.password and verify_password(credentials.password.value_or(""), *config_.password)) { return allow(); }
    return deny("Invalid password");
  case access_mode::two_factor:
    if (config_.password and not verify_password(credentials.password.value_or(""), *config_.password)) {
      return deny("Invalid password");
    }
    return verify_totp_code(credentials.totp_code) ? allow() : deny("Invalid 2FA code");
  }
  return deny("Unknown access mode");
}

auto access_control::verify_totp_code(const std::optional<std::string> &code) const -> bool
{
  if (not config_.totp_secret or not code) { return false; }
  const auto secret = base32_decode(*config_.totp_secret);
  if (not secret or secret->empty()) {
    spdlog::warn("[access_control] Stored TOTP secret is not valid base32");
    return false;
  }
  return verify_totp(*secret, *code, clock_());
}

auto access_control::verify_connection_pin(std::string_view pin) -> auth_result
{
  pin_rotation_observer observer;
  access_config snapshot;
  {
    const std::scoped_lock lock(mutex_);
    auto &connection_pin = config_.connection_pin;
    if (not connection_pin.required) { return allow(); }

    if (connection_pin.expires_at and clock_() > *connection_pin.expires_at) { return deny("PIN has expired"); }
    if (pin != connection_pin.value) { return deny("Invalid PIN"); }
    if (not connection_pin.one_time) { return allow(); }

    connection_pin.value = core::random_digits(connection_pin.value.size());
    spdlog::info("[access_control] One-time connection PIN used, rotated");
    observer = rotation_observer_;
    snapshot = config_;
  }

  if (observer) { observer(snapshot.connection_pin.value, snapshot); }
  return allow();
}

auto access_control::on_connection_pin_rotated(pin_rotation_observer observer) -> void
{
  const std::scoped_lock lock(mutex_);
  rotation_observer_ = std::move(observer);
}

auto access_control::connection_pin_required() const -> bool
{
  const std::scoped_lock lock(mutex_);
  return config_.connection_pin.required;
}

auto access_control::admits_without_credentials(std::string_view client_ip) const -> bool
{
  const std::scoped_lock lock(mutex_);
  if (contains(config_.denied_ips, client_ip) or config_.connection_pin.required) { return false; }
  return config_.mode == access_mode::public_access
         or (config_.mode == access_mode::whitelist and contains(config_.allowed_ips, client_ip));
}

auto access_control::set_pin_code(const std::string &pin) -> operation_result
{
  if (not is_valid_pin(pin)) { return { .success = false, .error = "PIN must be 4-8 digits" }; }

  const std::scoped_lock lock(mutex_);
  config_.pin_code = pin;
  config_.mode = access_mode::pin;
  return { .success = true, .error = std::nullopt };
}

auto access_control::set_password(std::string_view password) -> operation_result
{
  if (password.size() < min_password_length) {
    return { .success = false, .error = "Password must be at least 4 characters" };
  }

  auto digest = hash_password(password);
  const std::scoped_lock lock(mutex_);
  config_.password = std::move(digest);
  config_.mode = access_mode::password;
  return { .success = true, .error = std::nullopt };
}

auto access_control::enable_2fa() -> two_factor_setup
{
  const auto random = core::random_bytes(totp_secret_bytes);
  std::vector<std::uint8_t> key;
  key.reserve(random.size());
  for (const auto byte : random) { key.push_back(static_cast<std::uint8_t>(byte)); }
  auto secret = base32_encode(key);

  const std::scoped_lock lock(mutex_);
  config_.totp_secret = secret;
  config_.two_factor_enabled = true;
  config_.mode = access_mode::two_factor;

  auto url = fmt::format(
    "otpauth://totp/OpenLink:{}?secret={}&issuer=OpenLink", config_.host_name.value_or("relay"), secret);
  return { .secret = std::move(secret), .otpauth_url = std::move(url) };
}

auto access_control::set_public() -> void
{
  const std::scoped_lock lock(mutex_);
  config_.is_public = true;
  config_.mode = access_mode::public_access;
  config_.public_warning_shown = false;
}

auto access_control::set_private() -> void
{
  const std::scoped_lock lock(mutex_);
  config_.is_public = false;
}

auto access_control::set_whitelist_mode() -> void
{
  const std::scoped_lock lock(mutex_);
  config_.mode = access_mode::whitelist;
}

auto access_control::set_connection_pin(const std::string &pin, connection_pin_options options) -> connection_pin_result
{
  if (not is_valid_pin(pin)) {
    return { .success = false, .error = "PIN must be 4-8 digits", .pin = {}, .expires_at = std::nullopt, .one_time = false };
  }
  const std::scoped_lock lock(mutex_);
  return apply_connection_pin(pin, options);
}

auto access_control::generate_connection_pin(std::size_t digits, connection_pin_options options)
  -> connection_pin_result
{
  if (digits < min_pin_digits or digits > max_pin_digits) {
    return { .success = false, .error = "PIN must be 4-8 digits", .pin = {}, .expires_at = std::nullopt, .one_time = false };
  }
  const auto pin = core::random_digits(digits);
  const std::scoped_lock lock(mutex_);
  return apply_connection_pin(pin, options);
}

auto access_control::apply_connection_pin(const std::string &pin, connection_pin_options options)
  -> connection_pin_result
{
  auto &connection_pin = config_.connection_pin;
  connection_pin.required = true;
  connection_pin.value = pin;
  connection_pin.one_time = options.one_time;
  connection_pin.expires_at.reset();
  if (options.expiry) { connection_pin.expires_at = clock_() + *options.expiry; }

  return { .success = true,
    .error = std::nullopt,
    .pin = pin,
    .expires_at = connection_pin.expires_at,
    .one_time = connection_pin.one_time };
}

auto access_control::clear_connection_pin() -> void
{
  const std::scoped_lock lock(mutex_);
  config_.connection_pin = connection_pin_config{};
}

auto access_control::allow_ip(const std::string &client_ip) -> void
{
  const std::scoped_lock lock(mutex_);
  add_unique(config_.allowed_ips, client_ip);
}

auto access_control::remove_allowed_ip(const std::string &client_ip) -> void
{
  const std::scoped_lock lock(mutex_);
  std::erase(config_.allowed_ips, client_ip);
}

auto access_control::deny_ip(const std::string &client_ip) -> void
{
  const std::scoped_lock lock(mutex_);
  add_unique(config_.denied_ips, client_ip);
}

auto access_control::remove_denied_ip(const std::string &client_ip) -> void
{
  const std::scoped_lock lock(mutex_);
  std::erase(config_.denied_ips, client_ip);
}

auto access_control::set_host_name(std::optional<std::string> host_name) -> void
{
  const std::scoped_lock lock(mutex_);
  config_.host_name = std::move(host_name);
}

auto access_control::set_limits(std::size_t max_connections, std::size_t max_sessions_per_client) -> void
{
  const std::scoped_lock lock(mutex_);
  config_.max_connections = max_connections;
  config_.max_sessions_per_client = max_sessions_per_client;
}

auto access_control::take_public_warning() -> bool
{
  const std::scoped_lock lock(mutex_);
  if (not config_.is_public or config_.public_warning_shown) { return false; }
  config_.public_warning_shown = true;
  return true;
}

auto access_control::config() const -> access_config
{
  const std::scoped_lock lock(mutex_);
  return config_;
}

}// namespace openlink_relay::access
