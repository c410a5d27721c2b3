#include <relay/protocol.hpp>

#include <core/overload.hpp>

#include <openssl/evp.h>

namespace openlink_relay::relay::protocol {

namespace {

  auto read_string(const nlohmann::json &json, const char *key) -> std::optional<std::string>
  {
    if (json.contains(key) and json[key].is_string()) { return json[key].get<std::string>(); }
    return std::nullopt;
  }

  auto read_credentials(const nlohmann::json &json) -> access::auth_data
  {
    access::auth_data auth;
    if (not json.is_object()) { return auth; }
    auth.pin = read_string(json, "pin");
    auth.password = read_string(json, "password");
    auth.totp_code = read_string(json, "totpCode");
    auth.connection_pin = read_string(json, "connectionPin");
    return auth;
  }

}// namespace

auto decode(std::string_view text) -> std::optional<inbound_message_t>
{
  auto json = nlohmann::json::parse(text, nullptr, false);
  if (json.is_discarded() or not json.is_object()) { return std::nullopt; }

  const auto type = read_string(json, "type");
  if (not type) { return std::nullopt; }

  if (*type == "authenticate") { return authenticate{ .auth = read_credentials(json.value("auth", nlohmann::json::object())) }; }

  if (*type == "create-session") {
    auto session_id = read_string(json, "sessionId");
    if (session_id and session_id->empty()) { session_id.reset(); }
    return create_session{ .session_id = std::move(session_id) };
  }

  if (*type == "join-session" or *type == "leave-session" or *type == "signal" or *type == "broadcast") {
    auto session_id = read_string(json, "sessionId");
    if (not session_id) { return std::nullopt; }
    if (*type == "join-session") { return join_session{ .session_id = std::move(*session_id) }; }
    if (*type == "leave-session") { return leave_session{ .session_id = std::move(*session_id) }; }
    if (*type == "broadcast") {
      return broadcast{ .session_id = std::move(*session_id), .payload = json.value("payload", nlohmann::json()) };
    }
    auto target_id = read_string(json, "targetId");
    return signal{ .session_id = std::move(*session_id), .target_id = std::move(target_id), .message = std::move(json) };
  }

  if (*type == "relay-data" or *type == "relay-media") {
    auto target_id = read_string(json, "targetId");
    if (not target_id) { return std::nullopt; }
    if (*type == "relay-data") {
      return relay_data{ .target_id = std::move(*target_id), .payload = json.value("payload", nlohmann::json()) };
    }
    const auto encoded = read_string(json, "payload");
    if (not encoded) { return std::nullopt; }
    auto bytes = decode_base64(*encoded);
    if (not bytes) { return std::nullopt; }
    return relay_media{ .target_id = std::move(*target_id), .payload = std::move(*bytes) };
  }

  return unknown_message{ .type = *type };
}

auto type_name(const inbound_message_t &message) -> std::string_view
{
  return std::visit(core::overload{ [](const authenticate &) -> std::string_view { return "authenticate"; },
                      [](const create_session &) -> std::string_view { return "create-session"; },
                      [](const join_session &) -> std::string_view { return "join-session"; },
                      [](const leave_session &) -> std::string_view { return "leave-session"; },
                      [](const signal &) -> std::string_view { return "signal"; },
                      [](const relay_data &) -> std::string_view { return "relay-data"; },
                      [](const relay_media &) -> std::string_view { return "relay-media"; },
                      [](const broadcast &) -> std::string_view { return "broadcast"; },
                      [](const unknown_message &msg) -> std::string_view { return msg.type; } },
    message);
}

auto decode_base64(std::string_view text) -> std::optional<std::vector<std::byte>>
{
  static constexpr std::size_t quantum = 4;
  static constexpr std::size_t decoded_quantum = 3;

  std::string padded(text);
  if (padded.size() % quantum == 1) { return std::nullopt; }
  while (padded.size() % quantum != 0) { padded.push_back('='); }

  std::vector<unsigned char> output(padded.size() / quantum * decoded_quantum);
  const int written = EVP_DecodeBlock(
    output.data(), reinterpret_cast<const unsigned char *>(padded.data()), static_cast<int>(padded.size()));
  if (written < 0) { return std::nullopt; }

  auto length = static_cast<std::size_t>(written);
  for (auto iter = padded.rbegin(); iter != padded.rend() and *iter == '=' and length > 0; ++iter) { --length; }

  std::vector<std::byte> bytes(length);
  for (std::size_t i = 0; i < length; ++i) { bytes[i] = static_cast<std::byte>(output[i]); }
  return bytes;
}

auto encode_base64(const std::vector<std::byte> &bytes) -> std::string
{
  static constexpr std::size_t quantum = 4;
  static constexpr std::size_t decoded_quantum = 3;

  std::string output((bytes.size() + decoded_quantum - 1) / decoded_quantum * quantum + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
    reinterpret_cast<const unsigned char *>(bytes.data()),
    static_cast<int>(bytes.size()));
  output.resize(static_cast<std::size_t>(written));
  return output;
}

auto make_auth_required(const std::string &client_id,
  access::access_mode mode,
  const std::optional<std::string> &server_name) -> std::string
{
  return nlohmann::json{ { "type", "auth-required" },
    { "clientId", client_id },
    { "accessMode", std::string(access::to_string(mode)) },
    { "serverName", server_name ? nlohmann::json(*server_name) : nlohmann::json(nullptr) } }
    .dump();
}

auto make_auth_success(const std::string &client_id) -> std::string
{
  return nlohmann::json{ { "type", "auth-success" }, { "clientId", client_id } }.dump();
}

auto make_auth_failed(const std::string &reason) -> std::string
{
  return nlohmann::json{ { "type", "auth-failed" }, { "error", reason } }.dump();
}

auto make_auth_timeout() -> std::string
{
  return nlohmann::json{ { "type", "auth-timeout" }, { "error", "Authentication timeout" } }.dump();
}

auto make_connected(const std::string &client_id) -> std::string
{
  return nlohmann::json{ { "type", "connected" }, { "clientId", client_id } }.dump();
}

auto make_error(const std::string &error, const std::optional<std::string> &session_id) -> std::string
{
  nlohmann::json json{ { "type", "error" }, { "error", error } };
  if (session_id) { json["sessionId"] = *session_id; }
  return json.dump();
}

auto make_session_created(const std::string &session_id) -> std::string
{
  return nlohmann::json{ { "type", "session-created" }, { "sessionId", session_id }, { "isHost", true } }.dump();
}

auto make_session_joined(const std::string &session_id,
  const std::string &host_id,
  const std::vector<std::string> &participants) -> std::string
{
  return nlohmann::json{
    { "type", "session-joined" }, { "sessionId", session_id }, { "host", host_id }, { "participants", participants }
  }
    .dump();
}

auto make_peer_joined(const std::string &session_id, const std::string &peer_id) -> std::string
{
  return nlohmann::json{ { "type", "peer-joined" }, { "sessionId", session_id }, { "peerId", peer_id } }.dump();
}

auto make_peer_left(const std::string &session_id, const std::string &peer_id) -> std::string
{
  return nlohmann::json{ { "type", "peer-left" }, { "sessionId", session_id }, { "peerId", peer_id } }.dump();
}

auto make_signal(nlohmann::json message, const std::string &sender_id) -> std::string
{
  message["senderId"] = sender_id;
  return message.dump();
}

auto make_relay_data(const std::string &sender_id, const nlohmann::json &payload) -> std::string
{
  return nlohmann::json{ { "type", "relay-data" }, { "senderId", sender_id }, { "payload", payload } }.dump();
}

auto make_broadcast(const std::string &sender_id, const nlohmann::json &payload) -> std::string
{
  return nlohmann::json{ { "type", "broadcast" }, { "senderId", sender_id }, { "payload", payload } }.dump();
}

}// namespace openlink_relay::relay::protocol
