#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace openlink_relay::relay {

/// Longest custom session id a client may request
constexpr std::size_t max_session_id_length = 64;

/// Operator-controlled domains a shareable link may point at
[[nodiscard]] auto default_link_domains() -> std::vector<std::string>;

struct shareable_link
{
  std::string url;///< https://<domain>/<session id>
  std::string session_id;
  std::string domain;
  std::string short_url;///< <domain>/<session id>
};

struct parsed_link
{
  std::string session_id;
  std::string domain;
};

/**
 * @brief Checks that a session id is 1-64 URL-safe characters ([A-Za-z0-9_-]).
 */
[[nodiscard]] auto is_valid_session_id(std::string_view session_id) -> bool;

/**
 * @brief Builds a shareable link for a session.
 *
 * @param domains Domain pool
 * @param session_id Existing session id; a fresh one is generated when absent
 * @param preferred_domain Domain to use if it is in the pool; otherwise a random pool domain
 * @return The link
 * @throws std::invalid_argument if the pool is empty or session_id is not URL-safe
 */
[[nodiscard]] auto generate_shareable_link(const std::vector<std::string> &domains,
  std::optional<std::string> session_id = std::nullopt,
  const std::optional<std::string> &preferred_domain = std::nullopt) -> shareable_link;

/**
 * @brief Extracts the session id from a shareable link.
 *
 * Accepts "http(s)://<domain>/<id>" and "<domain>/<id>". Only domains in the
 * pool match; the domain comparison ignores case.
 *
 * @return Session id and domain, or std::nullopt if the link does not match
 */
[[nodiscard]] auto parse_shareable_link(std::string_view link, const std::vector<std::string> &domains)
  -> std::optional<parsed_link>;

}// namespace openlink_relay::relay
