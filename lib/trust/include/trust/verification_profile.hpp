#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace openlink_relay::trust {

/// Externally granted verification tier
enum class verification_level : std::uint8_t { none, basic, verified, trusted };

/// Bucket of a trust score
enum class trust_level : std::uint8_t { unverified, basic, verified, trusted, highly_trusted };

struct custom_link
{
  std::string name;
  std::string url;
  bool verified{};
  std::uint64_t added_at{};///< Epoch milliseconds
};

/**
 * @brief Identity claims a host publishes about itself.
 */
struct verification_profile
{
  bool verified{};
  verification_level level{ verification_level::none };
  std::optional<std::uint64_t> verified_at;///< Epoch milliseconds
  std::optional<std::string> mastodon;///< "@user@instance"
  std::optional<std::string> mastodon_url;
  std::optional<std::string> twitter;
  std::optional<std::string> github;
  std::optional<std::string> website;
  std::optional<std::string> email;
  std::optional<std::string> pgp_key_id;
  std::optional<std::string> organization;
  bool org_verified{};
  std::vector<std::string> badges;
  std::vector<custom_link> custom_links;
};

/**
 * @brief Social links applied by set_social_links(); empty fields leave the profile unchanged.
 */
struct social_links
{
  std::optional<std::string> twitter;
  std::optional<std::string> github;
  std::optional<std::string> website;
  std::optional<std::string> email;
  std::optional<std::string> pgp_key_id;
};

/**
 * @brief One displayable identity proof with its derived URL.
 */
struct verification_link
{
  std::string type;///< mastodon, twitter, github, website, email, pgp, custom
  std::string label;///< Handle, address, key id or link name
  std::optional<std::string> url;
  std::optional<bool> verified;///< Custom links only
};

struct edit_result
{
  bool success{};
  std::optional<std::string> error;
};

/// Ceiling of trust_score()
inline constexpr std::uint32_t max_trust_score{ 100 };

[[nodiscard]] auto to_string(verification_level level) -> std::string_view;
[[nodiscard]] auto parse_verification_level(std::string_view text) -> std::optional<verification_level>;
[[nodiscard]] auto to_string(trust_level level) -> std::string_view;

/// Human-readable label ("Highly Trusted", ...)
[[nodiscard]] auto label(trust_level level) -> std::string_view;

/**
 * @brief Weighted sum of identity claims, capped at max_trust_score.
 *
 * verified +30; level basic +10, verified +25, trusted +40; mastodon +10,
 * twitter +5, github +10, website +5, email +5, PGP +15; organization +5,
 * organization verified +15; +5 per badge; +5 per verified custom link.
 */
[[nodiscard]] auto trust_score(const verification_profile &profile) -> std::uint32_t;

/// >=80 highly trusted, >=60 trusted, >=40 verified, >=20 basic, else unverified
[[nodiscard]] auto trust_level_for(std::uint32_t score) -> trust_level;

/**
 * @brief Sets the Mastodon handle.
 *
 * @param profile Profile to edit
 * @param handle "@user@instance"
 * @param url Profile URL, derived as https://instance/@user when omitted
 */
auto set_mastodon(verification_profile &profile, const std::string &handle, std::optional<std::string> url = std::nullopt)
  -> edit_result;

auto set_social_links(verification_profile &profile, const social_links &links) -> void;

auto add_custom_link(verification_profile &profile, std::string name, std::string url, std::uint64_t added_at)
  -> edit_result;

auto set_organization(verification_profile &profile, std::string name, bool verified) -> void;

/**
 * @brief Lists the profile's proofs in display order with derived URLs.
 */
[[nodiscard]] auto verification_links(const verification_profile &profile) -> std::vector<verification_link>;

[[nodiscard]] auto to_json(const verification_profile &profile) -> nlohmann::json;
[[nodiscard]] auto to_json(const verification_link &link) -> nlohmann::json;

/**
 * @brief Reads a persisted profile; missing fields keep their defaults.
 */
[[nodiscard]] auto verification_profile_from_json(const nlohmann::json &json) -> verification_profile;

}// namespace openlink_relay::trust
