#include <directory/server_descriptor.hpp>

#include <array>
#include <nlohmann/json.hpp>

namespace openlink_relay::directory {

namespace {

  auto address_kind_from_string(std::string_view text) -> std::optional<address::address_kind>
  {
    static constexpr std::array kinds{ address::address_kind::ipv4,
      address::address_kind::ipv6,
      address::address_kind::domain,
      address::address_kind::ens,
      address::address_kind::unstoppable,
      address::address_kind::unknown };
    for (const auto kind : kinds) {
      if (address::to_string(kind) == text) { return kind; }
    }
    return std::nullopt;
  }

  auto string_or(const nlohmann::json &json, const char *key, std::string fallback) -> std::string
  {
    if (json.contains(key) and json[key].is_string()) { return json[key].get<std::string>(); }
    return fallback;
  }

}// namespace

auto to_string(server_kind kind) -> std::string_view
{
  switch (kind) {
  case server_kind::primary:
    return "primary";
  case server_kind::fallback:
    return "fallback";
  case server_kind::community:
    return "community";
  case server_kind::custom:
    break;
  }
  return "custom";
}

auto to_string(server_preference preference) -> std::string_view
{
  switch (preference) {
  case server_preference::always:
    return "always";
  case server_preference::once:
    return "once";
  case server_preference::never:
    return "never";
  case server_preference::none:
    break;
  }
  return "none";
}

auto parse_server_kind(std::string_view text) -> std::optional<server_kind>
{
  if (text == "primary") { return server_kind::primary; }
  if (text == "fallback") { return server_kind::fallback; }
  if (text == "community") { return server_kind::community; }
  if (text == "custom") { return server_kind::custom; }
  return std::nullopt;
}

auto parse_server_preference(std::string_view text) -> std::optional<server_preference>
{
  if (text == "none") { return server_preference::none; }
  if (text == "always") { return server_preference::always; }
  if (text == "once") { return server_preference::once; }
  if (text == "never") { return server_preference::never; }
  return std::nullopt;
}

auto to_json(const server_descriptor &server) -> nlohmann::json
{
  nlohmann::json json = {
    { "name", server.name },
    { "url", server.url },
    { "type", std::string(to_string(server.kind)) },
    { "region", server.region },
    { "features", server.features },
  };
  if (server.address_kind) { json["addressType"] = std::string(address::to_string(*server.address_kind)); }
  if (server.added_at) { json["addedAt"] = *server.added_at; }
  if (server.preference != server_preference::none) { json["preference"] = std::string(to_string(server.preference)); }
  return json;
}

auto server_from_json(const nlohmann::json &json) -> std::optional<server_descriptor>
{
  if (not json.is_object() or not json.contains("url") or not json["url"].is_string()) { return std::nullopt; }

  server_descriptor server;
  server.url = json["url"].get<std::string>();
  if (server.url.empty()) { return std::nullopt; }
  server.name = string_or(json, "name", server.url);
  server.region = string_or(json, "region", "");
  server.kind = parse_server_kind(string_or(json, "type", "custom")).value_or(server_kind::custom);
  server.preference = parse_server_preference(string_or(json, "preference", "none")).value_or(server_preference::none);

  if (json.contains("features") and json["features"].is_array()) {
    for (const auto &feature : json["features"]) {
      if (feature.is_string()) { server.features.push_back(feature.get<std::string>()); }
    }
  }
  if (json.contains("addressType") and json["addressType"].is_string()) {
    server.address_kind = address_kind_from_string(json["addressType"].get<std::string>());
  }
  if (json.contains("addedAt") and json["addedAt"].is_number_unsigned()) {
    server.added_at = json["addedAt"].get<std::uint64_t>();
  }
  return server;
}

auto default_servers() -> std::vector<server_descriptor>
{
  const std::vector<std::string> signaling{ "signaling" };
  const std::vector<std::string> full{ "signaling", "relay", "turn" };

  return {
    { .name = "Local Server", .url = "ws://localhost:8765", .kind = server_kind::primary, .region = "Local", .features = signaling },
    { .name = "TappedIn (Legacy)", .url = "ws://vps1.tappedin.fm:8765", .kind = server_kind::fallback, .region = "US", .features = signaling },
    { .name = "OpenLink", .url = "wss://openlink.raywonderis.me", .kind = server_kind::primary, .region = "US", .features = full },
    { .name = "TappedIn", .url = "wss://openlink.tappedin.fm", .kind = server_kind::fallback, .region = "US", .features = full },
    { .name = "Devine (.net)", .url = "wss://openlink.devinecreations.net", .kind = server_kind::fallback, .region = "US", .features = full },
    { .name = "Devine Creations", .url = "wss://openlink.devine-creations.com", .kind = server_kind::fallback, .region = "US", .features = full },
    { .name = "Walter Harper", .url = "wss://openlink.walterharper.com", .kind = server_kind::fallback, .region = "US", .features = full },
    { .name = "Tetoee Howard", .url = "wss://openlink.tetoeehoward.com", .kind = server_kind::fallback, .region = "US", .features = full },
  };
}

}// namespace openlink_relay::directory
