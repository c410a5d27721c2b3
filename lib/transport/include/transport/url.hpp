#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace openlink_relay::transport {

/**
 * @brief Components of an absolute URL as needed to open a connection.
 */
struct url_parts
{
  std::string scheme;///< Lower-cased scheme without "://" (e.g. "wss")
  std::string host;///< Hostname or IP literal, IPv6 without brackets
  std::string port;///< Explicit port, or the scheme default
  std::string target;///< Path plus query, "/" when absent
  bool explicit_port{};///< Whether the URL named a port
};

/**
 * @brief Default port for a scheme.
 *
 * @param scheme One of ws, wss, http, https
 * @return "443" for secure schemes, "80" otherwise
 */
[[nodiscard]] auto default_port(std::string_view scheme) -> std::string;

/**
 * @brief Splits an absolute URL.
 *
 * Accepts bracketed IPv6 hosts ("wss://[::1]:8765/"). Rejects a missing scheme,
 * an empty host, and ports outside 1-65535.
 *
 * @param url URL text
 * @return Parsed parts or std::nullopt if the URL is malformed
 */
[[nodiscard]] auto parse_url(std::string_view url) -> std::optional<url_parts>;

/**
 * @brief Host and port joined for use in a URL authority, bracketing IPv6.
 */
[[nodiscard]] auto format_authority(const url_parts &parts) -> std::string;

/**
 * @brief Percent-encodes a query component (RFC 3986 unreserved set kept).
 */
[[nodiscard]] auto url_encode(std::string_view text) -> std::string;

}// namespace openlink_relay::transport
