#include <access/access_config.hpp>
#include <platform/time_utils.hpp>

#include <nlohmann/json.hpp>

namespace openlink_relay::access {

namespace {

  template<typename T> auto read_or(const nlohmann::json &json, const char *key, T fallback) -> T
  {
    if (not json.contains(key) or json[key].is_null()) { return fallback; }
    try {
      return json[key].get<T>();
    } catch (const nlohmann::json::exception &) {
      return fallback;
    }
  }

  auto read_optional_string(const nlohmann::json &json, const char *key) -> std::optional<std::string>
  {
    if (json.contains(key) and json[key].is_string()) { return json[key].get<std::string>(); }
    return std::nullopt;
  }

}// namespace

auto to_string(access_mode mode) -> std::string_view
{
  switch (mode) {
  case access_mode::public_access:
    return "public";
  case access_mode::pin:
    return "pin";
  case access_mode::password:
    return "password";
  case access_mode::two_factor:
    return "2fa";
  case access_mode::whitelist:
    break;
  }
  return "whitelist";
}

auto parse_access_mode(std::string_view text) -> std::optional<access_mode>
{
  if (text == "public") { return access_mode::public_access; }
  if (text == "pin") { return access_mode::pin; }
  if (text == "password") { return access_mode::password; }
  if (text == "2fa" or text == "two-factor") { return access_mode::two_factor; }
  if (text == "whitelist") { return access_mode::whitelist; }
  return std::nullopt;
}

auto to_json(const access_config &config) -> nlohmann::json
{
  nlohmann::json json = {
    { "isPublic", config.is_public },
    { "accessMode", std::string(to_string(config.mode)) },
    { "hostName", config.host_name ? nlohmann::json(*config.host_name) : nlohmann::json(nullptr) },
    { "maxConnections", config.max_connections },
    { "maxSessionsPerClient", config.max_sessions_per_client },
    { "pinCode", config.pin_code ? nlohmann::json(*config.pin_code) : nlohmann::json(nullptr) },
    { "twoFactorSecret", config.totp_secret ? nlohmann::json(*config.totp_secret) : nlohmann::json(nullptr) },
    { "twoFactorEnabled", config.two_factor_enabled },
    { "whitelistedIPs", config.allowed_ips },
    { "blacklistedIPs", config.denied_ips },
    { "requireConnectionPin", config.connection_pin.required },
    { "connectionPin", config.connection_pin.value },
    { "connectionPinExpiry",
      config.connection_pin.expires_at ? platform::to_unix_millis(*config.connection_pin.expires_at) : 0 },
    { "oneTimePin", config.connection_pin.one_time },
    { "publicWarningShown", config.public_warning_shown },
  };
  if (config.password) {
    json["password"] = {
      { "salt", config.password->salt },
      { "hash", config.password->hash },
      { "iterations", config.password->iterations },
    };
  } else {
    json["password"] = nullptr;
  }
  return json;
}

auto access_config_from_json(const nlohmann::json &json) -> access_config
{
  access_config config;
  if (not json.is_object()) { return config; }

  config.is_public = read_or(json, "isPublic", config.is_public);
  config.mode = parse_access_mode(read_or<std::string>(json, "accessMode", "public")).value_or(access_mode::public_access);
  config.host_name = read_optional_string(json, "hostName");
  config.max_connections = read_or(json, "maxConnections", config.max_connections);
  config.max_sessions_per_client = read_or(json, "maxSessionsPerClient", config.max_sessions_per_client);
  config.pin_code = read_optional_string(json, "pinCode");
  config.totp_secret = read_optional_string(json, "twoFactorSecret");
  config.two_factor_enabled = read_or(json, "twoFactorEnabled", false);
  config.allowed_ips = read_or(json, "whitelistedIPs", std::vector<std::string>{});
  config.denied_ips = read_or(json, "blacklistedIPs", std::vector<std::string>{});

  config.public_warning_shown = read_or(json, "publicWarningShown", false);

  config.connection_pin.required = read_or(json, "requireConnectionPin", false);
  config.connection_pin.value = read_or<std::string>(json, "connectionPin", "");
  config.connection_pin.one_time = read_or(json, "oneTimePin", false);
  if (const auto expiry = read_or<std::uint64_t>(json, "connectionPinExpiry", 0); expiry > 0) {
    config.connection_pin.expires_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(expiry));
  }

  if (json.contains("password") and json["password"].is_object()) {
    const auto &password = json["password"];
    config.password = password_digest{ .salt = read_or<std::string>(password, "salt", ""),
      .hash = read_or<std::string>(password, "hash", ""),
      .iterations = read_or<std::uint32_t>(password, "iterations", 0) };
  }
  return config;
}

}// namespace openlink_relay::access
