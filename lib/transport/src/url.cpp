#include <transport/url.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fmt/format.h>

namespace openlink_relay::transport {

namespace {

  auto is_valid_port(std::string_view port) -> bool
  {
    static constexpr int max_port = 65535;

    if (port.empty()) { return false; }
    int value{};
    const auto *end = port.data() + port.size();
    auto [ptr, error] = std::from_chars(port.data(), end, value);
    return error == std::errc{} and ptr == end and value > 0 and value <= max_port;
  }

}// namespace

auto default_port(std::string_view scheme) -> std::string
{
  if (scheme == "wss" or scheme == "https") { return "443"; }
  return "80";
}

auto parse_url(std::string_view url) -> std::optional<url_parts>
{
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos or scheme_end == 0) { return std::nullopt; }

  url_parts parts;
  parts.scheme = std::string(url.substr(0, scheme_end));
  std::ranges::transform(
    parts.scheme, parts.scheme.begin(), [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

  auto rest = url.substr(scheme_end + 3);
  const auto authority_end = rest.find_first_of("/?#");
  auto authority = rest.substr(0, authority_end);
  parts.target = authority_end == std::string_view::npos ? "/" : std::string(rest.substr(authority_end));
  if (parts.target.starts_with('?')) { parts.target.insert(0, "/"); }
  if (auto fragment = parts.target.find('#'); fragment != std::string::npos) { parts.target.resize(fragment); }

  if (auto at_sign = authority.rfind('@'); at_sign != std::string_view::npos) { authority = authority.substr(at_sign + 1); }

  std::string_view port;
  if (authority.starts_with('[')) {
    const auto close = authority.find(']');
    if (close == std::string_view::npos) { return std::nullopt; }
    parts.host = std::string(authority.substr(1, close - 1));
    auto after = authority.substr(close + 1);
    if (not after.empty()) {
      if (not after.starts_with(':')) { return std::nullopt; }
      port = after.substr(1);
      if (not is_valid_port(port)) { return std::nullopt; }
    }
  } else {
    const auto colon = authority.find(':');
    if (colon != std::string_view::npos) {
      if (authority.find(':', colon + 1) != std::string_view::npos) { return std::nullopt; }
      port = authority.substr(colon + 1);
      if (not is_valid_port(port)) { return std::nullopt; }
      authority = authority.substr(0, colon);
    }
    parts.host = std::string(authority);
  }

  if (parts.host.empty()) { return std::nullopt; }

  parts.explicit_port = not port.empty();
  parts.port = parts.explicit_port ? std::string(port) : default_port(parts.scheme);
  return parts;
}

auto format_authority(const url_parts &parts) -> std::string
{
  const bool is_ipv6 = parts.host.find(':') != std::string::npos;
  const auto host = is_ipv6 ? fmt::format("[{}]", parts.host) : parts.host;
  if (not parts.explicit_port) { return host; }
  return fmt::format("{}:{}", host, parts.port);
}

auto url_encode(std::string_view text) -> std::string
{
  std::string encoded;
  encoded.reserve(text.size());
  for (const unsigned char character : text) {
    if (std::isalnum(character) != 0 or character == '-' or character == '_' or character == '.' or character == '~') {
      encoded.push_back(static_cast<char>(character));
    } else {
      encoded += fmt::format("%{:02X}", character);
    }
  }
  return encoded;
}

}// namespace openlink_relay::transport
