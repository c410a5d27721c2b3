#include <address/address.hpp>
#include <transport/url.hpp>

#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <cctype>
#include <charconv>
#include <fmt/format.h>
#include <optional>
#include <string>

namespace openlink_relay::address {

namespace {

  constexpr std::size_t max_hostname_length = 253;
  constexpr std::size_t max_label_length = 63;

  auto trim(std::string_view text) -> std::string_view
  {
    while (not text.empty() and std::isspace(static_cast<unsigned char>(text.front())) != 0) { text.remove_prefix(1); }
    while (not text.empty() and std::isspace(static_cast<unsigned char>(text.back())) != 0) { text.remove_suffix(1); }
    return text;
  }

  auto parse_port(std::string_view text) -> std::optional<std::uint16_t>
  {
    static constexpr unsigned max_port = 65535;

    unsigned value{};
    const auto *end = text.data() + text.size();
    auto [ptr, error] = std::from_chars(text.data(), end, value);
    if (text.empty() or error != std::errc{} or ptr != end or value == 0 or value > max_port) { return std::nullopt; }
    return static_cast<std::uint16_t>(value);
  }

  auto is_ipv4(std::string_view text) -> bool
  {
    if (std::ranges::count(text, '.') != 3) { return false; }
    boost::system::error_code error;
    boost::asio::ip::make_address_v4(std::string(text), error);
    return not error;
  }

  auto is_ipv6(std::string_view text) -> bool
  {
    boost::system::error_code error;
    boost::asio::ip::make_address_v6(std::string(text), error);
    return not error;
  }

  auto is_hostname(std::string_view text) -> bool
  {
    if (text.empty() or text.size() > max_hostname_length) { return false; }
    if (text.back() == '.') { text.remove_suffix(1); }

    std::size_t label_length = 0;
    char previous = '.';
    for (const char character : text) {
      if (character == '.') {
        if (label_length == 0 or previous == '-') { return false; }
        label_length = 0;
      } else {
        const bool valid = std::isalnum(static_cast<unsigned char>(character)) != 0 or character == '-' or character == '_';
        if (not valid or (label_length == 0 and character == '-') or ++label_length > max_label_length) { return false; }
      }
      previous = character;
    }
    return label_length > 0 and previous != '-';
  }

  auto has_suffix(std::string_view host, const std::vector<std::string> &suffixes) -> bool
  {
    return std::ranges::any_of(suffixes, [host](const std::string &suffix) {
      if (host.size() <= suffix.size() + 1) { return false; }
      const auto tail = host.substr(host.size() - suffix.size());
      if (host[host.size() - suffix.size() - 1] != '.') { return false; }
      return std::ranges::equal(tail, suffix, [](char lhs, char rhs) {
        return std::tolower(static_cast<unsigned char>(lhs)) == std::tolower(static_cast<unsigned char>(rhs));
      });
    });
  }

  auto parse_url_form(address_parse_result result, const parse_options &options) -> address_parse_result
  {
    const auto parts = transport::parse_url(result.original);
    if (not parts) {
      const auto rest = std::string_view(result.original).substr(result.original.find("://") + 3);
      result.host = std::string(rest.substr(0, rest.find_first_of(":/?#")));
      result.protocol = result.original.starts_with("wss://") ? "wss" : "ws";
      result.port = result.protocol == "wss" ? default_secure_port : default_plain_port;
      return result;
    }

    result.host = parts->host;
    result.protocol = parts->scheme;
    result.port = parse_port(parts->port).value_or(result.protocol == "wss" ? default_secure_port : default_plain_port);
    result.kind = detect_kind(result.host, options);
    result.requires_resolution = result.kind == address_kind::ens or result.kind == address_kind::unstoppable;
    return result;
  }

}// namespace

auto to_string(address_kind kind) -> std::string_view
{
  switch (kind) {
  case address_kind::ipv4:
    return "ipv4";
  case address_kind::ipv6:
    return "ipv6";
  case address_kind::domain:
    return "domain";
  case address_kind::ens:
    return "ens";
  case address_kind::unstoppable:
    return "unstoppable";
  case address_kind::unknown:
    break;
  }
  return "unknown";
}

auto detect_kind(std::string_view hostname, const parse_options &options) -> address_kind
{
  if (hostname.starts_with('[') and hostname.ends_with(']')) { hostname = hostname.substr(1, hostname.size() - 2); }

  if (is_ipv4(hostname)) { return address_kind::ipv4; }
  if (hostname.find(':') != std::string_view::npos) {
    return is_ipv6(hostname) ? address_kind::ipv6 : address_kind::unknown;
  }
  const bool numeric = std::ranges::all_of(
    hostname, [](char character) { return std::isdigit(static_cast<unsigned char>(character)) != 0 or character == '.'; });
  if (numeric or not is_hostname(hostname)) { return address_kind::unknown; }
  if (has_suffix(hostname, options.ens_suffixes)) { return address_kind::ens; }
  if (has_suffix(hostname, options.unstoppable_suffixes)) { return address_kind::unstoppable; }
  return address_kind::domain;
}

auto parse(std::string_view address, const parse_options &options) -> address_parse_result
{
  address_parse_result result;
  result.original = std::string(address);
  result.port = default_secure_port;

  const auto text = trim(address);
  if (text.empty()) { return result; }

  if (text.starts_with("ws://") or text.starts_with("wss://")) {
    result.original = std::string(text);
    auto parsed = parse_url_form(std::move(result), options);
    parsed.original = std::string(address);
    return parsed;
  }

  // [IPv6]:port
  if (text.starts_with('[')) {
    const auto close = text.find(']');
    result.host = std::string(text.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1));
    if (close == std::string_view::npos or not is_ipv6(result.host)) { return result; }
    const auto after = text.substr(close + 1);
    if (not after.empty()) {
      const auto port = after.starts_with(':') ? parse_port(after.substr(1)) : std::nullopt;
      if (not port) { return result; }
      result.port = *port;
    }
    result.kind = address_kind::ipv6;
    return result;
  }

  // Bare IPv6 has at least two colons
  if (std::ranges::count(text, ':') > 1) {
    result.host = std::string(text);
    if (is_ipv6(text)) { result.kind = address_kind::ipv6; }
    return result;
  }

  // host[:port] for IPv4, Web3 and conventional domains
  const auto colon = text.find(':');
  const auto host = text.substr(0, colon);
  result.host = std::string(host);
  if (colon != std::string_view::npos) {
    const auto port = parse_port(text.substr(colon + 1));
    if (not port) { return result; }
    result.port = *port;
  }

  result.kind = detect_kind(host, options);
  result.requires_resolution = result.kind == address_kind::ens or result.kind == address_kind::unstoppable;
  return result;
}

auto to_server_url(const address_parse_result &parsed) -> std::string
{
  const auto text = trim(parsed.original);
  if (text.starts_with("ws://") or text.starts_with("wss://")) { return std::string(text); }

  const auto protocol_port = parsed.protocol == "ws" ? default_plain_port : default_secure_port;
  transport::url_parts parts{ .scheme = parsed.protocol,
    .host = parsed.host,
    .port = std::to_string(parsed.port),
    .target = "/",
    .explicit_port = parsed.port != protocol_port };
  return fmt::format("{}://{}", parts.scheme, transport::format_authority(parts));
}

}// namespace openlink_relay::address
