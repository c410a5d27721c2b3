#pragma once

#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace openlink_relay::core::events {

/// Relay host lifecycle and per-connection notifications
namespace relay {

  /// Relay host started listening
  struct started
  {
    std::string bind_host;///< Address the listener is bound to
    std::uint16_t port{};///< Port the listener is bound to
  };

  /// Relay host stopped and dropped all state
  struct stopped
  {
  };

  /// A WebSocket client connected
  struct connection_opened
  {
    std::string connection_id;///< Relay-assigned connection identifier
    std::string remote_ip;///< Remote address of the client
    bool authenticated{};///< Whether the connection was admitted without credentials
  };

  /// A connection was released (socket close or error)
  struct connection_closed
  {
    std::string connection_id;///< Connection identifier
  };

  /// Connection passed authentication
  struct authenticated
  {
    std::string connection_id;///< Connection identifier
  };

  /// Connection submitted invalid credentials
  struct auth_failed
  {
    std::string connection_id;///< Connection identifier
    std::string reason;///< Deny reason sent to the client
  };

  /// Connection was closed for not authenticating in time
  struct auth_timed_out
  {
    std::string connection_id;///< Connection identifier
  };

  /// A one-time connection PIN was used and replaced
  struct connection_pin_rotated
  {
    std::string pin;///< PIN now required from the next client
  };

  /// A session was created
  struct session_created
  {
    std::string session_id;///< Session identifier
    std::string host_id;///< Connection that created the session
  };

  /// A connection joined a session
  struct session_joined
  {
    std::string session_id;///< Session identifier
    std::string connection_id;///< Joining connection
  };

  /// A connection left a session (explicitly or by disconnecting)
  struct session_left
  {
    std::string session_id;///< Session identifier
    std::string connection_id;///< Leaving connection
  };

  /// A session lost its last participant and was removed
  struct session_closed
  {
    std::string session_id;///< Session identifier
  };

  /// A malformed or unknown message was ignored
  struct protocol_error
  {
    std::string connection_id;///< Offending connection
    std::string detail;///< What was wrong with the message
  };

}// namespace relay

/// Variant of all relay notifications
using relay_event_t = std::variant<relay::started,
  relay::stopped,
  relay::connection_opened,
  relay::connection_closed,
  relay::authenticated,
  relay::auth_failed,
  relay::auth_timed_out,
  relay::connection_pin_rotated,
  relay::session_created,
  relay::session_joined,
  relay::session_left,
  relay::session_closed,
  relay::protocol_error>;

/// Server directory notifications
namespace directory {

  /// Cached health status of a server changed after a probe
  struct health_changed
  {
    std::string url;///< Server URL
    std::string previous;///< Previous status label ("unknown" if never probed)
    std::string current;///< New status label
    std::optional<std::uint32_t> latency_ms;///< Probe latency when a response arrived
  };

  /// Community server list was fetched
  struct community_refreshed
  {
    std::size_t count{};///< Number of community servers now known
  };

  /// Community server list could not be fetched
  struct community_refresh_failed
  {
    std::string error_message;///< Failure reason
  };

}// namespace directory

/// Variant of all directory notifications
using directory_event_t =
  std::variant<directory::health_changed, directory::community_refreshed, directory::community_refresh_failed>;

/// Concept for relay notification types
template<typename T>
concept RelayEvent = std::same_as<T, relay::started> or std::same_as<T, relay::stopped>
                     or std::same_as<T, relay::connection_opened> or std::same_as<T, relay::connection_closed>
                     or std::same_as<T, relay::authenticated> or std::same_as<T, relay::auth_failed>
                     or std::same_as<T, relay::auth_timed_out> or std::same_as<T, relay::connection_pin_rotated>
                     or std::same_as<T, relay::session_created>
                     or std::same_as<T, relay::session_joined> or std::same_as<T, relay::session_left>
                     or std::same_as<T, relay::session_closed> or std::same_as<T, relay::protocol_error>;

/// Concept for directory notification types
template<typename T>
concept DirectoryEvent = std::same_as<T, directory::health_changed> or std::same_as<T, directory::community_refreshed>
                         or std::same_as<T, directory::community_refresh_failed>;

}// namespace openlink_relay::core::events
