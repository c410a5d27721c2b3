#include <relay/session_link.hpp>

#include <core/id_generator.hpp>
#include <core/secure_random.hpp>

#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace openlink_relay::relay {

namespace {

  auto strip_scheme(std::string_view link) -> std::string_view
  {
    for (const std::string_view scheme : { "https://", "http://" }) {
      if (boost::algorithm::istarts_with(link, scheme)) { return link.substr(scheme.size()); }
    }
    return link;
  }

}// namespace

auto default_link_domains() -> std::vector<std::string>
{
  return { "openlink.tappedin.fm", "openlink.devinecreations.net", "openlink.devine-creations.com" };
}

auto is_valid_session_id(std::string_view session_id) -> bool
{
  if (session_id.empty() or session_id.size() > max_session_id_length) { return false; }
  return std::ranges::all_of(session_id, [](char character) {
    return std::isalnum(static_cast<unsigned char>(character)) != 0 or character == '-' or character == '_';
  });
}

auto generate_shareable_link(const std::vector<std::string> &domains,
  std::optional<std::string> session_id,
  const std::optional<std::string> &preferred_domain) -> shareable_link
{
  if (domains.empty()) { throw std::invalid_argument("shareable link domain pool is empty"); }

  auto id = session_id.value_or(core::id_generator::session_id());
  if (not is_valid_session_id(id)) { throw std::invalid_argument(fmt::format("invalid session id '{}'", id)); }

  std::string domain;
  if (preferred_domain
      and std::ranges::find_if(domains, [&](const auto &candidate) {
            return boost::algorithm::iequals(candidate, *preferred_domain);
          }) != domains.end()) {
    domain = *preferred_domain;
  } else {
    domain = domains[core::random_index(domains.size())];
  }

  auto short_url = fmt::format("{}/{}", domain, id);
  return shareable_link{
    .url = "https://" + short_url, .session_id = std::move(id), .domain = std::move(domain), .short_url = std::move(short_url)
  };
}

auto parse_shareable_link(std::string_view link, const std::vector<std::string> &domains) -> std::optional<parsed_link>
{
  const auto rest = strip_scheme(link);
  const auto slash = rest.find('/');
  if (slash == std::string_view::npos) { return std::nullopt; }

  const auto host = rest.substr(0, slash);
  auto session_id = rest.substr(slash + 1);
  if (not session_id.empty() and session_id.back() == '/') { session_id.remove_suffix(1); }
  if (not is_valid_session_id(session_id)) { return std::nullopt; }

  const auto match =
    std::ranges::find_if(domains, [&](const auto &domain) { return boost::algorithm::iequals(domain, host); });
  if (match == domains.end()) { return std::nullopt; }

  return parsed_link{ .session_id = std::string(session_id), .domain = *match };
}

}// namespace openlink_relay::relay
