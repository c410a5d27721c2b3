#pragma once

#include <platform/time_utils.hpp>
#include <relay/relay_engine.hpp>
#include <transport/websocket_peer.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace openlink_relay::relay {

/**
 * @brief Listener-facing front of the relay.
 *
 * WebSocket traffic is forwarded to the engine; plain HTTP GETs are answered
 * with health and status JSON.
 */
class relay_gateway
{
public:
  using engine_t = relay_engine<transport::websocket_peer>;

  relay_gateway(std::shared_ptr<engine_t> engine, platform::wall_clock_t clock = platform::system_wall_clock());

  auto on_open(std::shared_ptr<transport::websocket_peer> peer, const std::string &remote_ip)
    -> std::optional<std::string>;
  auto on_text(const std::string &connection_id, const std::string &text) -> void;
  auto on_binary(const std::string &connection_id, std::vector<std::byte> bytes) -> void;
  auto on_close(const std::string &connection_id) -> void;

  /**
   * @brief Answers a plain HTTP GET.
   *
   * "/health" yields {status, sessions, connections, uptime}; "/api/status"
   * yields {type, version, features, sessions}. Query strings are ignored.
   *
   * @param target Request target
   * @return JSON body, std::nullopt for unknown targets
   */
  [[nodiscard]] auto http_get(const std::string &target) -> std::optional<std::string>;

private:
  std::shared_ptr<engine_t> engine_;
  platform::wall_clock_t clock_;
};

}// namespace openlink_relay::relay
