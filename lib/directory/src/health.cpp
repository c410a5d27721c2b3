#include <directory/health.hpp>
#include <transport/url.hpp>

#include <fmt/format.h>

namespace openlink_relay::directory {

auto to_string(health_status status) -> std::string_view
{
  switch (status) {
  case health_status::online:
    return "online";
  case health_status::degraded:
    return "degraded";
  case health_status::offline:
    return "offline";
  case health_status::timeout:
    return "timeout";
  case health_status::error:
    break;
  }
  return "error";
}

auto health_url(std::string_view server_url) -> std::optional<std::string>
{
  const auto parts = transport::parse_url(server_url);
  if (not parts or (parts->scheme != "ws" and parts->scheme != "wss")) { return std::nullopt; }

  const auto *scheme = parts->scheme == "wss" ? "https" : "http";
  return fmt::format("{}://{}/health", scheme, transport::format_authority(*parts));
}

}// namespace openlink_relay::directory
