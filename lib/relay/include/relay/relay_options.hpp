#pragma once

#include <relay/session_link.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace openlink_relay::relay {

/// Relay host settings
struct relay_options
{
  static constexpr std::uint16_t default_port{ 8765 };
  static constexpr std::chrono::seconds default_auth_timeout{ 30 };

  std::uint16_t port{ default_port };
  std::string bind_host{ "0.0.0.0" };
  std::chrono::milliseconds auth_timeout{ default_auth_timeout };///< Time a client has to authenticate
  std::vector<std::string> link_domains{ default_link_domains() };///< Shareable link domain pool
};

}// namespace openlink_relay::relay
