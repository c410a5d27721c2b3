#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace openlink_relay::address {

/// Kind of endpoint an address string names
enum class address_kind : std::uint8_t { ipv4, ipv6, domain, ens, unstoppable, unknown };

/**
 * @brief Typed view of a raw address string.
 *
 * Pure function of the input; never carries resolution results.
 */
struct address_parse_result
{
  std::string original;///< Input as given
  address_kind kind{ address_kind::unknown };///< Detected kind
  std::string host;///< Host part, IPv6 without brackets (best effort for unknown)
  std::uint16_t port{};///< Explicit port or the protocol default
  std::string protocol{ "wss" };///< "ws" or "wss"
  bool requires_resolution{};///< True for Web3 domains
};

/**
 * @brief Web3 top-level labels recognized by parse() and detect_kind().
 */
struct parse_options
{
  std::vector<std::string> ens_suffixes{ "eth" };
  std::vector<std::string> unstoppable_suffixes{
    "crypto", "nft", "wallet", "blockchain", "bitcoin", "x", "888", "dao", "zil"
  };
};

/// Port used when a secure or bare address names none
inline constexpr std::uint16_t default_secure_port{ 443 };

/// Port used for ws:// URLs without an explicit port
inline constexpr std::uint16_t default_plain_port{ 80 };

[[nodiscard]] auto to_string(address_kind kind) -> std::string_view;

/**
 * @brief Classifies a bare hostname (no scheme, no port).
 *
 * @param hostname Hostname or IP literal, IPv6 optionally bracketed
 * @param options Web3 suffix lists
 * @return ipv4, ipv6, ens, unstoppable, domain, or unknown for invalid names
 */
[[nodiscard]] auto detect_kind(std::string_view hostname, const parse_options &options = {}) -> address_kind;

/**
 * @brief Parses an address typed by a user or read from a server list.
 *
 * Recognizes, in order: a ws:// or wss:// URL, IPv4[:port], [IPv6][:port] or bare
 * IPv6, a Web3 domain by suffix, and a conventional domain[:port]. Never throws;
 * malformed input yields address_kind::unknown with host and port filled where
 * they could be recovered.
 *
 * @param address Raw address text
 * @param options Web3 suffix lists
 * @return Parse result
 */
[[nodiscard]] auto parse(std::string_view address, const parse_options &options = {}) -> address_parse_result;

/**
 * @brief Relay URL for a parsed address.
 *
 * A ws:// or wss:// input is returned trimmed. A bare address becomes
 * "<protocol>://<host>[:<port>]", with IPv6 bracketed and the port omitted when
 * it is the protocol default.
 *
 * @param parsed Result of parse(); must not be address_kind::unknown
 * @return The URL
 */
[[nodiscard]] auto to_server_url(const address_parse_result &parsed) -> std::string;

}// namespace openlink_relay::address
