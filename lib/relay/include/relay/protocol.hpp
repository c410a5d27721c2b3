#pragma once

#include <access/access_control.hpp>

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace openlink_relay::relay::protocol {

/// {"type":"authenticate","auth":{pin,password,totpCode,connectionPin}}
struct authenticate
{
  access::auth_data auth;
};

/// {"type":"create-session","sessionId"?}
struct create_session
{
  std::optional<std::string> session_id;///< Custom id requested by the client
};

/// {"type":"join-session","sessionId"}
struct join_session
{
  std::string session_id;
};

/// {"type":"leave-session","sessionId"}
struct leave_session
{
  std::string session_id;
};

/// {"type":"signal","sessionId","targetId"?,...}; forwarded as-is plus senderId
struct signal
{
  std::string session_id;
  std::optional<std::string> target_id;
  nlohmann::json message;///< Whole original object
};

/// {"type":"relay-data","targetId","payload"}
struct relay_data
{
  std::string target_id;
  nlohmann::json payload;
};

/// {"type":"relay-media","targetId","payload":<base64>}; delivered as a binary frame
struct relay_media
{
  std::string target_id;
  std::vector<std::byte> payload;
};

/// {"type":"broadcast","sessionId","payload"}
struct broadcast
{
  std::string session_id;
  nlohmann::json payload;
};

/// Well-formed message with a type the relay does not handle
struct unknown_message
{
  std::string type;
};

using inbound_message_t =
  std::variant<authenticate, create_session, join_session, leave_session, signal, relay_data, relay_media, broadcast, unknown_message>;

/**
 * @brief Decodes a client text frame.
 *
 * @param text JSON text
 * @return The message, unknown_message for an unhandled type, or std::nullopt if
 *         the frame is not a JSON object with a string "type" or a known type
 *         lacks a required field
 */
[[nodiscard]] auto decode(std::string_view text) -> std::optional<inbound_message_t>;

/// Name of the inbound message type, for logs
[[nodiscard]] auto type_name(const inbound_message_t &message) -> std::string_view;

/**
 * @brief Decodes standard base64 (padding optional).
 *
 * @return Bytes, or std::nullopt for invalid input
 */
[[nodiscard]] auto decode_base64(std::string_view text) -> std::optional<std::vector<std::byte>>;

[[nodiscard]] auto encode_base64(const std::vector<std::byte> &bytes) -> std::string;

// Outbound frames

[[nodiscard]] auto make_auth_required(const std::string &client_id,
  access::access_mode mode,
  const std::optional<std::string> &server_name) -> std::string;
[[nodiscard]] auto make_auth_success(const std::string &client_id) -> std::string;
[[nodiscard]] auto make_auth_failed(const std::string &reason) -> std::string;
[[nodiscard]] auto make_auth_timeout() -> std::string;
[[nodiscard]] auto make_connected(const std::string &client_id) -> std::string;
[[nodiscard]] auto make_error(const std::string &error, const std::optional<std::string> &session_id = std::nullopt)
  -> std::string;
[[nodiscard]] auto make_session_created(const std::string &session_id) -> std::string;
[[nodiscard]] auto make_session_joined(const std::string &session_id,
  const std::string &host_id,
  const std::vector<std::string> &participants) -> std::string;
[[nodiscard]] auto make_peer_joined(const std::string &session_id, const std::string &peer_id) -> std::string;
[[nodiscard]] auto make_peer_left(const std::string &session_id, const std::string &peer_id) -> std::string;
[[nodiscard]] auto make_signal(nlohmann::json message, const std::string &sender_id) -> std::string;
[[nodiscard]] auto make_relay_data(const std::string &sender_id, const nlohmann::json &payload) -> std::string;
[[nodiscard]] auto make_broadcast(const std::string &sender_id, const nlohmann::json &payload) -> std::string;

}// namespace openlink_relay::relay::protocol
