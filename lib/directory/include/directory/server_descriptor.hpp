#pragma once

#include <address/address.hpp>

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace openlink_relay::directory {

/// Which list a server came from
enum class server_kind : std::uint8_t { primary, fallback, community, custom };

/// Operator preference on a saved server
enum class server_preference : std::uint8_t { none, always, once, never };

/**
 * @brief A relay server known to the directory.
 */
struct server_descriptor
{
  std::string name;///< Display name
  std::string url;///< ws:// or wss:// URL, or a bare address for custom entries
  server_kind kind{ server_kind::custom };///< Source list
  std::string region;///< Free-form region label
  std::vector<std::string> features;///< e.g. "signaling", "relay", "turn"
  std::optional<address::address_kind> address_kind;///< Parsed kind (custom entries)
  std::optional<std::uint64_t> added_at;///< Epoch milliseconds (custom entries)
  server_preference preference{ server_preference::none };///< Selection preference (custom entries)
};

/**
 * @brief A server paired with its last probed status.
 */
struct annotated_server
{
  server_descriptor server;
  std::string status;///< Health status label, "unknown" if never probed
};

[[nodiscard]] auto to_string(server_kind kind) -> std::string_view;
[[nodiscard]] auto to_string(server_preference preference) -> std::string_view;
[[nodiscard]] auto parse_server_kind(std::string_view text) -> std::optional<server_kind>;
[[nodiscard]] auto parse_server_preference(std::string_view text) -> std::optional<server_preference>;

/**
 * @brief Serializes a server in the persisted and community-list format.
 */
[[nodiscard]] auto to_json(const server_descriptor &server) -> nlohmann::json;

/**
 * @brief Reads a server from the persisted or community-list format.
 *
 * @param json Object with at least a string "url"
 * @return The server, or std::nullopt if required fields are missing
 */
[[nodiscard]] auto server_from_json(const nlohmann::json &json) -> std::optional<server_descriptor>;

/**
 * @brief Built-in relay servers shipped with the application.
 *
 * The first entry is the last-resort choice of get_best_server().
 */
[[nodiscard]] auto default_servers() -> std::vector<server_descriptor>;

}// namespace openlink_relay::directory
