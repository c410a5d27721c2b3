#include <relay/relay_gateway.hpp>

#include <concepts/connection_handler.hpp>
#include <internal_use_only/config.hpp>

#include <chrono>
#include <nlohmann/json.hpp>
#include <string_view>

namespace openlink_relay::relay {

static_assert(concepts::connection_handler<relay_gateway, transport::websocket_peer>);

relay_gateway::relay_gateway(std::shared_ptr<engine_t> engine, platform::wall_clock_t clock)
  : engine_(std::move(engine)), clock_(std::move(clock))
{}

auto relay_gateway::on_open(std::shared_ptr<transport::websocket_peer> peer, const std::string &remote_ip)
  -> std::optional<std::string>
{
  return engine_->on_open(std::move(peer), remote_ip);
}

auto relay_gateway::on_text(const std::string &connection_id, const std::string &text) -> void
{
  engine_->on_text(connection_id, text);
}

auto relay_gateway::on_binary(const std::string &connection_id, std::vector<std::byte> bytes) -> void
{
  engine_->on_binary(connection_id, std::move(bytes));
}

auto relay_gateway::on_close(const std::string &connection_id) -> void { engine_->on_close(connection_id); }

auto relay_gateway::http_get(const std::string &target) -> std::optional<std::string>
{
  std::string_view path = target;
  if (const auto query = path.find('?'); query != std::string_view::npos) { path = path.substr(0, query); }

  const auto stats = engine_->stats();
  if (path == "/health") {
    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(clock_() - stats.started_at);
    return nlohmann::json{ { "status", "healthy" },
      { "sessions", stats.sessions },
      { "connections", stats.connections },
      { "uptime", uptime.count() } }
      .dump();
  }
  if (path == "/api/status") {
    return nlohmann::json{ { "type", "openlink-relay" },
      { "version", std::string(cmake::project_version) },
      { "features", { "signaling", "relay", "turn" } },
      { "sessions", stats.sessions } }
      .dump();
  }
  return std::nullopt;
}

}// namespace openlink_relay::relay
