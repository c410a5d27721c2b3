#include <trust/verification_profile.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace openlink_relay::trust {

namespace {

  constexpr std::uint32_t verified_weight = 30;
  constexpr std::uint32_t basic_weight = 10;
  constexpr std::uint32_t verified_level_weight = 25;
  constexpr std::uint32_t trusted_weight = 40;
  constexpr std::uint32_t mastodon_weight = 10;
  constexpr std::uint32_t twitter_weight = 5;
  constexpr std::uint32_t github_weight = 10;
  constexpr std::uint32_t website_weight = 5;
  constexpr std::uint32_t email_weight = 5;
  constexpr std::uint32_t pgp_weight = 15;
  constexpr std::uint32_t organization_weight = 5;
  constexpr std::uint32_t org_verified_weight = 15;
  constexpr std::uint32_t badge_weight = 5;
  constexpr std::uint32_t custom_link_weight = 5;

  constexpr std::uint32_t highly_trusted_floor = 80;
  constexpr std::uint32_t trusted_floor = 60;
  constexpr std::uint32_t verified_floor = 40;
  constexpr std::uint32_t basic_floor = 20;

  auto is_word(std::string_view text) -> bool
  {
    return not text.empty() and std::ranges::all_of(text, [](char character) {
      return std::isalnum(static_cast<unsigned char>(character)) != 0 or character == '_';
    });
  }

  auto is_instance(std::string_view text) -> bool
  {
    return not text.empty() and std::ranges::all_of(text, [](char character) {
      return std::isalnum(static_cast<unsigned char>(character)) != 0 or character == '_' or character == '.'
             or character == '-';
    });
  }

  auto read_string(const nlohmann::json &json, const char *key) -> std::optional<std::string>
  {
    if (json.contains(key) and json[key].is_string()) { return json[key].get<std::string>(); }
    return std::nullopt;
  }

  auto optional_json(const std::optional<std::string> &value) -> nlohmann::json
  {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
  }

}// namespace

auto to_string(verification_level level) -> std::string_view
{
  switch (level) {
  case verification_level::basic:
    return "basic";
  case verification_level::verified:
    return "verified";
  case verification_level::trusted:
    return "trusted";
  case verification_level::none:
    break;
  }
  return "none";
}

auto parse_verification_level(std::string_view text) -> std::optional<verification_level>
{
  if (text == "none") { return verification_level::none; }
  if (text == "basic") { return verification_level::basic; }
  if (text == "verified") { return verification_level::verified; }
  if (text == "trusted") { return verification_level::trusted; }
  return std::nullopt;
}

auto to_string(trust_level level) -> std::string_view
{
  switch (level) {
  case trust_level::highly_trusted:
    return "highly-trusted";
  case trust_level::trusted:
    return "trusted";
  case trust_level::verified:
    return "verified";
  case trust_level::basic:
    return "basic";
  case trust_level::unverified:
    break;
  }
  return "unverified";
}

auto label(trust_level level) -> std::string_view
{
  switch (level) {
  case trust_level::highly_trusted:
    return "Highly Trusted";
  case trust_level::trusted:
    return "Trusted";
  case trust_level::verified:
    return "Verified";
  case trust_level::basic:
    return "Basic Verification";
  case trust_level::unverified:
    break;
  }
  return "Unverified";
}

auto trust_score(const verification_profile &profile) -> std::uint32_t
{
  std::uint32_t score = 0;
  if (profile.verified) { score += verified_weight; }

  switch (profile.level) {
  case verification_level::basic:
    score += basic_weight;
    break;
  case verification_level::verified:
    score += verified_level_weight;
    break;
  case verification_level::trusted:
    score += trusted_weight;
    break;
  case verification_level::none:
    break;
  }

  if (profile.mastodon) { score += mastodon_weight; }
  if (profile.twitter) { score += twitter_weight; }
  if (profile.github) { score += github_weight; }
  if (profile.website) { score += website_weight; }
  if (profile.email) { score += email_weight; }
  if (profile.pgp_key_id) { score += pgp_weight; }
  if (profile.organization) { score += organization_weight; }
  if (profile.org_verified) { score += org_verified_weight; }

  score += static_cast<std::uint32_t>(std::min<std::size_t>(profile.badges.size(), max_trust_score)) * badge_weight;
  score += static_cast<std::uint32_t>(std::ranges::count_if(profile.custom_links, &custom_link::verified)) * custom_link_weight;

  return std::min(score, max_trust_score);
}

auto trust_level_for(std::uint32_t score) -> trust_level
{
  if (score >= highly_trusted_floor) { return trust_level::highly_trusted; }
  if (score >= trusted_floor) { return trust_level::trusted; }
  if (score >= verified_floor) { return trust_level::verified; }
  if (score >= basic_floor) { return trust_level::basic; }
  return trust_level::unverified;
}

auto set_mastodon(verification_profile &profile, const std::string &handle, std::optional<std::string> url) -> edit_result
{
  const auto separator = handle.find('@', 1);
  const bool valid = handle.starts_with('@') and separator != std::string::npos
                     and is_word(std::string_view(handle).substr(1, separator - 1))
                     and is_instance(std::string_view(handle).substr(separator + 1));
  if (not valid) { return { .success = false, .error = "Invalid Mastodon handle format. Use @user@instance.social" }; }

  const auto user = handle.substr(1, separator - 1);
  const auto instance = handle.substr(separator + 1);
  profile.mastodon = handle;
  profile.mastodon_url = url.value_or(fmt::format("https://{}/@{}", instance, user));
  return { .success = true, .error = std::nullopt };
}

auto set_social_links(verification_profile &profile, const social_links &links) -> void
{
  const auto apply = [](std::optional<std::string> &field, const std::optional<std::string> &value) {
    if (value and not value->empty()) { field = value; }
  };
  apply(profile.twitter, links.twitter);
  apply(profile.github, links.github);
  apply(profile.website, links.website);
  apply(profile.email, links.email);
  apply(profile.pgp_key_id, links.pgp_key_id);
}

auto add_custom_link(verification_profile &profile, std::string name, std::string url, std::uint64_t added_at)
  -> edit_result
{
  if (name.empty() or url.empty()) { return { .success = false, .error = "Link name and URL are required" }; }
  profile.custom_links.push_back({ .name = std::move(name), .url = std::move(url), .verified = false, .added_at = added_at });
  return { .success = true, .error = std::nullopt };
}

auto set_organization(verification_profile &profile, std::string name, bool verified) -> void
{
  profile.organization = std::move(name);
  profile.org_verified = verified;
}

auto verification_links(const verification_profile &profile) -> std::vector<verification_link>
{
  std::vector<verification_link> links;
  if (profile.mastodon) {
    links.push_back({ .type = "mastodon", .label = *profile.mastodon, .url = profile.mastodon_url, .verified = std::nullopt });
  }
  if (profile.twitter) {
    links.push_back({ .type = "twitter",
      .label = fmt::format("@{}", *profile.twitter),
      .url = fmt::format("https://twitter.com/{}", *profile.twitter),
      .verified = std::nullopt });
  }
  if (profile.github) {
    links.push_back({ .type = "github",
      .label = *profile.github,
      .url = fmt::format("https://github.com/{}", *profile.github),
      .verified = std::nullopt });
  }
  if (profile.website) {
    links.push_back({ .type = "website", .label = *profile.website, .url = profile.website, .verified = std::nullopt });
  }
  if (profile.email) {
    links.push_back({ .type = "email", .label = *profile.email, .url = std::nullopt, .verified = std::nullopt });
  }
  if (profile.pgp_key_id) {
    links.push_back({ .type = "pgp",
      .label = *profile.pgp_key_id,
      .url = fmt::format("https://keys.openpgp.org/search?q={}", *profile.pgp_key_id),
      .verified = std::nullopt });
  }
  for (const auto &link : profile.custom_links) {
    links.push_back({ .type = "custom", .label = link.name, .url = link.url, .verified = link.verified });
  }
  return links;
}

auto to_json(const verification_link &link) -> nlohmann::json
{
  nlohmann::json json = { { "type", link.type }, { "label", link.label } };
  if (link.url) { json["url"] = *link.url; }
  if (link.verified) { json["verified"] = *link.verified; }
  return json;
}

auto to_json(const verification_profile &profile) -> nlohmann::json
{
  auto custom_links = nlohmann::json::array();
  for (const auto &link : profile.custom_links) {
    custom_links.push_back(
      { { "name", link.name }, { "url", link.url }, { "verified", link.verified }, { "addedAt", link.added_at } });
  }

  return {
    { "verified", profile.verified },
    { "verificationLevel", std::string(to_string(profile.level)) },
    { "verifiedAt", profile.verified_at ? nlohmann::json(*profile.verified_at) : nlohmann::json(nullptr) },
    { "mastodon", optional_json(profile.mastodon) },
    { "mastodonUrl", optional_json(profile.mastodon_url) },
    { "twitter", optional_json(profile.twitter) },
    { "github", optional_json(profile.github) },
    { "website", optional_json(profile.website) },
    { "email", optional_json(profile.email) },
    { "pgpKeyId", optional_json(profile.pgp_key_id) },
    { "organization", optional_json(profile.organization) },
    { "orgVerified", profile.org_verified },
    { "badges", profile.badges },
    { "customLinks", custom_links },
  };
}

auto verification_profile_from_json(const nlohmann::json &json) -> verification_profile
{
  verification_profile profile;
  if (not json.is_object()) { return profile; }

  if (json.contains("verified") and json["verified"].is_boolean()) { profile.verified = json["verified"].get<bool>(); }
  profile.level =
    parse_verification_level(read_string(json, "verificationLevel").value_or("none")).value_or(verification_level::none);
  if (json.contains("verifiedAt") and json["verifiedAt"].is_number_unsigned()) {
    profile.verified_at = json["verifiedAt"].get<std::uint64_t>();
  }
  profile.mastodon = read_string(json, "mastodon");
  profile.mastodon_url = read_string(json, "mastodonUrl");
  profile.twitter = read_string(json, "twitter");
  profile.github = read_string(json, "github");
  profile.website = read_string(json, "website");
  profile.email = read_string(json, "email");
  profile.pgp_key_id = read_string(json, "pgpKeyId");
  profile.organization = read_string(json, "organization");
  if (json.contains("orgVerified") and json["orgVerified"].is_boolean()) {
    profile.org_verified = json["orgVerified"].get<bool>();
  }
  if (json.contains("badges") and json["badges"].is_array()) {
    for (const auto &badge : json["badges"]) {
      if (badge.is_string()) { profile.badges.push_back(badge.get<std::string>()); }
    }
  }
  if (json.contains("customLinks") and json["customLinks"].is_array()) {
    for (const auto &entry : json["customLinks"]) {
      if (not entry.is_object()) { continue; }
      auto name = read_string(entry, "name");
      auto url = read_string(entry, "url");
      if (not name or not url) { continue; }
      profile.custom_links.push_back({ .name = std::move(*name),
        .url = std::move(*url),
        .verified = entry.contains("verified") and entry["verified"].is_boolean() and entry["verified"].get<bool>(),
        .added_at = entry.contains("addedAt") and entry["addedAt"].is_number_unsigned() ? entry["addedAt"].get<std::uint64_t>()
                                                                                         : 0 });
    }
  }
  return profile;
}

}// namespace openlink_relay::trust
