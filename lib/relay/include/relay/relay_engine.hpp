#pragma once

#include <access/access_control.hpp>
#include <async/async_queue.hpp>
#include <concepts/relay_peer.hpp>
#include <core/events.hpp>
#include <core/id_generator.hpp>
#include <core/overload.hpp>
#include <platform/time_utils.hpp>
#include <relay/protocol.hpp>
#include <relay/session_link.hpp>

#include <algorithm>
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace openlink_relay::relay {

/// Read-only view of a session
struct session_info
{
  std::string session_id;
  std::string host_id;///< Connection that created the session
  std::vector<std::string> participants;///< In join order
  std::chrono::system_clock::time_point created_at;
};

/// Counters since the engine was last started
struct relay_stats
{
  std::size_t connections{};
  std::size_t sessions{};
  std::uint64_t total_connections{};
  std::uint64_t total_sessions{};
  std::uint64_t bytes_relayed{};
  std::chrono::system_clock::time_point started_at;
};

/**
 * @brief Session and connection bookkeeping for the relay.
 *
 * Owns the connection table (connection id to peer and auth state) and the
 * session table (session id to participants), each behind its own mutex. The
 * two locks are never held together; frames are collected under a lock and
 * sent after it is released. All entry points may be called from any thread.
 *
 * @tparam Peer Type satisfying concepts::relay_peer
 */
template<concepts::relay_peer Peer> class relay_engine : public std::enable_shared_from_this<relay_engine<Peer>>
{
public:
  using event_queue_t = async::async_queue<core::events::relay_event_t>;

  /**
   * @brief Constructs the engine.
   *
   * @param io_context Context running the auth timers
   * @param access Access policy shared with the operator surface
   * @param auth_timeout Time a client has to authenticate under a non-public mode
   * @param clock Wall clock for session timestamps and statistics
   * @param events Queue for lifecycle notifications; a private one is created when null
   */
  relay_engine(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<access::access_control> access,
    std::chrono::milliseconds auth_timeout,
    platform::wall_clock_t clock = platform::system_wall_clock(),
    std::shared_ptr<event_queue_t> events = nullptr)
    : io_context_(io_context), access_(std::move(access)), auth_timeout_(auth_timeout), clock_(std::move(clock)),
      events_(events ? std::move(events) : std::make_shared<event_queue_t>(io_context_)), started_at_(clock_())
  {}

  relay_engine(const relay_engine &) = delete;
  auto operator=(const relay_engine &) -> relay_engine & = delete;
  relay_engine(relay_engine &&) = delete;
  auto operator=(relay_engine &&) -> relay_engine & = delete;
  ~relay_engine() = default;

  /**
   * @brief Registers a new client.
   *
   * Refuses the client with "Server full" once max_connections is reached.
   * Otherwise sends "connected" when the client is admitted outright, or
   * "auth-required" and arms the auth timer.
   *
   * @param peer Client endpoint
   * @param remote_ip Client address
   * @return Assigned connection id, std::nullopt if refused
   */
  auto on_open(std::shared_ptr<Peer> peer, const std::string &remote_ip) -> std::optional<std::string>
  {
    const auto config = access_->config();
    const bool admitted = access_->admits_without_credentials(remote_ip);
    auto connection_id = core::id_generator::connection_id();

    bool full = false;
    {
      const std::scoped_lock lock(connections_mutex_);
      full = connections_.size() >= config.max_connections;
      if (not full) {
        connection_entry entry{
          .peer = peer, .remote_ip = remote_ip, .authenticated = admitted, .auth_timer = nullptr, .sessions = {}
        };
        if (not admitted) {
          entry.auth_timer = std::make_shared<boost::asio::steady_timer>(*io_context_, auth_timeout_);
          entry.auth_timer->async_wait(
            [weak_self = this->weak_from_this(), connection_id](const boost::system::error_code &error) {
              if (error) { return; }
              if (auto self = weak_self.lock()) { self->expire(connection_id); }
            });
        }
        connections_.emplace(connection_id, std::move(entry));
      }
    }

    if (full) {
      spdlog::warn("[relay_engine] Refusing {}: connection limit {} reached", remote_ip, config.max_connections);
      peer->send_text(protocol::make_error("Server full"));
      peer->close();
      return std::nullopt;
    }

    ++total_connections_;
    spdlog::debug("[relay_engine] Connection {} from {} (authenticated: {})", connection_id, remote_ip, admitted);

    if (admitted) {
      peer->send_text(protocol::make_connected(connection_id));
    } else {
      peer->send_text(protocol::make_auth_required(connection_id, config.mode, config.host_name));
    }
    events_->push(core::events::relay::connection_opened{
      .connection_id = connection_id, .remote_ip = remote_ip, .authenticated = admitted });
    return connection_id;
  }

  /**
   * @brief Handles one text frame from a client.
   *
   * Malformed frames and unknown types are logged and ignored.
   */
  auto on_text(const std::string &connection_id, const std::string &text) -> void
  {
    auto message = protocol::decode(text);
    if (not message) {
      protocol_error(connection_id, "malformed message");
      return;
    }

    const auto state = lookup(connection_id);
    if (not state) { return; }

    if (const auto *auth = std::get_if<protocol::authenticate>(&*message)) {
      authenticate(connection_id, state->peer, state->remote_ip, auth->auth);
      return;
    }

    if (not state->authenticated) {
      state->peer->send_text(protocol::make_error("Not authenticated"));
      return;
    }

    spdlog::trace("[relay_engine] {} from {}", protocol::type_name(*message), connection_id);
    std::visit(core::overload{ [](const protocol::authenticate &) {},
                 [&](const protocol::create_session &msg) { create_session(connection_id, state->peer, msg.session_id); },
                 [&](const protocol::join_session &msg) { join_session(connection_id, state->peer, msg.session_id); },
                 [&](const protocol::leave_session &msg) {
                   if (not leave_session(connection_id, msg.session_id)) {
                     state->peer->send_text(protocol::make_error("Not in session", msg.session_id));
                   }
                 },
                 [&](const protocol::signal &msg) { relay_signal(connection_id, state->peer, msg); },
                 [&](const protocol::relay_data &msg) { relay_data(connection_id, msg); },
                 [&](const protocol::relay_media &msg) { relay_media(connection_id, msg); },
                 [&](const protocol::broadcast &msg) { broadcast(connection_id, state->peer, msg); },
                 [&](const protocol::unknown_message &msg) {
                   protocol_error(connection_id, "unknown message type '" + msg.type + "'");
                 } },
      *message);
  }

  /// Clients never send binary frames; relay-media arrives base64-encoded in JSON
  auto on_binary(const std::string &connection_id, std::vector<std::byte> bytes) -> void
  {
    protocol_error(connection_id, "unexpected binary frame of " + std::to_string(bytes.size()) + " bytes");
  }

  /**
   * @brief Releases a connection.
   *
   * Cancels the auth timer, leaves every joined session, closes the peer.
   * Calling it for an unknown or already released connection does nothing.
   */
  auto on_close(const std::string &connection_id) -> void
  {
    connection_entry entry;
    {
      const std::scoped_lock lock(connections_mutex_);
      auto iter = connections_.find(connection_id);
      if (iter == connections_.end()) { return; }
      entry = std::move(iter->second);
      connections_.erase(iter);
      if (entry.auth_timer) { entry.auth_timer->cancel(); }
    }

    for (const auto &session_id : entry.sessions) { leave_session(connection_id, session_id); }
    entry.peer->close();

    spdlog::debug("[relay_engine] Connection {} closed", connection_id);
    events_->push(core::events::relay::connection_closed{ .connection_id = connection_id });
  }

  /// Closes every connection and drops all sessions
  auto close_all() -> void
  {
    std::vector<std::string> ids;
    {
      const std::scoped_lock lock(connections_mutex_);
      ids.reserve(connections_.size());
      for (const auto &[id, entry] : connections_) { ids.push_back(id); }
    }
    for (const auto &id : ids) { on_close(id); }

    const std::scoped_lock lock(sessions_mutex_);
    sessions_.clear();
  }

  [[nodiscard]] auto stats() const -> relay_stats
  {
    relay_stats result;
    result.connections = connection_count();
    result.sessions = session_count();
    result.total_connections = total_connections_.load();
    result.total_sessions = total_sessions_.load();
    result.bytes_relayed = bytes_relayed_.load();
    const std::scoped_lock lock(stats_mutex_);
    result.started_at = started_at_;
    return result;
  }

  [[nodiscard]] auto connection_count() const -> std::size_t
  {
    const std::scoped_lock lock(connections_mutex_);
    return connections_.size();
  }

  [[nodiscard]] auto session_count() const -> std::size_t
  {
    const std::scoped_lock lock(sessions_mutex_);
    return sessions_.size();
  }

  [[nodiscard]] auto session(const std::string &session_id) const -> std::optional<session_info>
  {
    const std::scoped_lock lock(sessions_mutex_);
    auto iter = sessions_.find(session_id);
    if (iter == sessions_.end()) { return std::nullopt; }
    return session_info{ .session_id = session_id,
      .host_id = iter->second.host_id,
      .participants = iter->second.participants,
      .created_at = iter->second.created_at };
  }

  [[nodiscard]] auto is_authenticated(const std::string &connection_id) const -> bool
  {
    const auto state = lookup(connection_id);
    return state and state->authenticated;
  }

  /// Outbound lifecycle notifications
  [[nodiscard]] auto events() const -> std::shared_ptr<event_queue_t> { return events_; }

private:
  struct connection_entry
  {
    std::shared_ptr<Peer> peer;
    std::string remote_ip;
    bool authenticated{};
    std::shared_ptr<boost::asio::steady_timer> auth_timer;
    std::set<std::string> sessions;///< Sessions this connection participates in
  };

  struct connection_state
  {
    std::shared_ptr<Peer> peer;
    std::string remote_ip;
    bool authenticated{};
  };

  struct session_entry
  {
    std::string host_id;
    std::vector<std::string> participants;
    std::chrono::system_clock::time_point created_at;
  };

  using delivery_t = std::vector<std::pair<std::shared_ptr<Peer>, std::string>>;

  [[nodiscard]] auto lookup(const std::string &connection_id) const -> std::optional<connection_state>
  {
    const std::scoped_lock lock(connections_mutex_);
    auto iter = connections_.find(connection_id);
    if (iter == connections_.end()) { return std::nullopt; }
    return connection_state{
      .peer = iter->second.peer, .remote_ip = iter->second.remote_ip, .authenticated = iter->second.authenticated
    };
  }

  /// Sends text to each listed connection that is still present and open
  auto send_to(const std::vector<std::string> &recipients, const std::string &text) -> std::size_t
  {
    std::vector<std::shared_ptr<Peer>> peers;
    {
      const std::scoped_lock lock(connections_mutex_);
      for (const auto &id : recipients) {
        auto iter = connections_.find(id);
        if (iter != connections_.end()) { peers.push_back(iter->second.peer); }
      }
    }

    std::size_t delivered = 0;
    for (const auto &peer : peers) {
      if (not peer->is_open()) { continue; }
      peer->send_text(text);
      ++delivered;
    }
    return delivered;
  }

  auto protocol_error(const std::string &connection_id, std::string detail) -> void
  {
    spdlog::warn("[relay_engine] Ignoring message from {}: {}", connection_id, detail);
    events_->push(core::events::relay::protocol_error{ .connection_id = connection_id, .detail = std::move(detail) });
  }

  auto authenticate(const std::string &connection_id,
    const std::shared_ptr<Peer> &peer,
    const std::string &remote_ip,
    const access::auth_data &auth) -> void
  {
    auto result = access_->verify(auth, remote_ip);
    if (result.allowed) { result = access_->verify_connection_pin(auth.connection_pin.value_or("")); }

    if (not result.allowed) {
      spdlog::info("[relay_engine] Authentication failed for {} ({}): {}", connection_id, remote_ip, result.reason);
      peer->send_text(protocol::make_auth_failed(result.reason));
      events_->push(core::events::relay::auth_failed{ .connection_id = connection_id, .reason = result.reason });
      return;
    }

    {
      const std::scoped_lock lock(connections_mutex_);
      auto iter = connections_.find(connection_id);
      if (iter == connections_.end()) { return; }
      iter->second.authenticated = true;
      if (iter->second.auth_timer) {
        iter->second.auth_timer->cancel();
        iter->second.auth_timer.reset();
      }
    }

    spdlog::info("[relay_engine] Connection {} authenticated", connection_id);
    peer->send_text(protocol::make_auth_success(connection_id));
    events_->push(core::events::relay::authenticated{ .connection_id = connection_id });
  }

  /// Auth timer fired; closes the connection unless it authenticated meanwhile
  auto expire(const std::string &connection_id) -> void
  {
    const auto state = lookup(connection_id);
    if (not state or state->authenticated) { return; }

    spdlog::info("[relay_engine] Connection {} did not authenticate in time", connection_id);
    state->peer->send_text(protocol::make_auth_timeout());
    events_->push(core::events::relay::auth_timed_out{ .connection_id = connection_id });
    on_close(connection_id);
  }

  auto create_session(const std::string &connection_id,
    const std::shared_ptr<Peer> &peer,
    const std::optional<std::string> &requested_id) -> void
  {
    if (requested_id and not is_valid_session_id(*requested_id)) {
      peer->send_text(protocol::make_error("Invalid session id"));
      return;
    }

    const auto max_sessions = access_->config().max_sessions_per_client;
    std::string session_id;
    std::optional<std::string> refusal;
    {
      const std::scoped_lock lock(sessions_mutex_);
      const auto hosted =
        std::ranges::count_if(sessions_, [&](const auto &item) { return item.second.host_id == connection_id; });
      if (static_cast<std::size_t>(hosted) >= max_sessions) {
        refusal = "Session limit reached";
      } else if (requested_id and sessions_.contains(*requested_id)) {
        refusal = "Session already exists";
      } else {
        if (requested_id) {
          session_id = *requested_id;
        } else {
          do { session_id = core::id_generator::session_id(); } while (sessions_.contains(session_id));
        }
        sessions_.emplace(session_id,
          session_entry{ .host_id = connection_id, .participants = { connection_id }, .created_at = clock_() });
      }
    }

    if (refusal) {
      peer->send_text(protocol::make_error(*refusal, requested_id));
      return;
    }

    if (not attach(connection_id, session_id)) {
      const std::scoped_lock lock(sessions_mutex_);
      sessions_.erase(session_id);
      return;
    }

    ++total_sessions_;
    spdlog::info("[relay_engine] Session {} created by {}", session_id, connection_id);
    peer->send_text(protocol::make_session_created(session_id));
    events_->push(core::events::relay::session_created{ .session_id = session_id, .host_id = connection_id });
  }

  auto join_session(const std::string &connection_id, const std::shared_ptr<Peer> &peer, const std::string &session_id)
    -> void
  {
    std::string host_id;
    std::vector<std::string> participants;
    std::vector<std::string> others;
    bool already_joined = false;
    bool found = false;
    {
      const std::scoped_lock lock(sessions_mutex_);
      auto iter = sessions_.find(session_id);
      found = iter != sessions_.end();
      if (found) {
        auto &members = iter->second.participants;
        already_joined = std::ranges::find(members, connection_id) != members.end();
        if (not already_joined) {
          others = members;
          members.push_back(connection_id);
        }
        host_id = iter->second.host_id;
        participants = members;
      }
    }

    if (not found) {
      peer->send_text(protocol::make_error("Session not found", session_id));
      return;
    }

    if (not already_joined and not attach(connection_id, session_id)) {
      leave_session(connection_id, session_id);
      return;
    }

    peer->send_text(protocol::make_session_joined(session_id, host_id, participants));
    if (already_joined) { return; }

    send_to(others, protocol::make_peer_joined(session_id, connection_id));
    spdlog::debug("[relay_engine] {} joined session {}", connection_id, session_id);
    events_->push(core::events::relay::session_joined{ .session_id = session_id, .connection_id = connection_id });
  }

  /**
   * @brief Removes a participant, notifies the rest, drops the session when empty.
   *
   * @return false if the connection was not a participant
   */
  auto leave_session(const std::string &connection_id, const std::string &session_id) -> bool
  {
    std::vector<std::string> remaining;
    bool closed = false;
    {
      const std::scoped_lock lock(sessions_mutex_);
      auto iter = sessions_.find(session_id);
      if (iter == sessions_.end()) { return false; }
      auto &members = iter->second.participants;
      auto member = std::ranges::find(members, connection_id);
      if (member == members.end()) { return false; }
      members.erase(member);
      remaining = members;
      if (members.empty()) {
        sessions_.erase(iter);
        closed = true;
      }
    }

    {
      const std::scoped_lock lock(connections_mutex_);
      auto iter = connections_.find(connection_id);
      if (iter != connections_.end()) { iter->second.sessions.erase(session_id); }
    }

    send_to(remaining, protocol::make_peer_left(session_id, connection_id));
    spdlog::debug("[relay_engine] {} left session {}", connection_id, session_id);
    events_->push(core::events::relay::session_left{ .session_id = session_id, .connection_id = connection_id });
    if (closed) {
      spdlog::info("[relay_engine] Session {} closed", session_id);
      events_->push(core::events::relay::session_closed{ .session_id = session_id });
    }
    return true;
  }

  /// Records session membership on the connection; false if it is already gone
  auto attach(const std::string &connection_id, const std::string &session_id) -> bool
  {
    const std::scoped_lock lock(connections_mutex_);
    auto iter = connections_.find(connection_id);
    if (iter == connections_.end()) { return false; }
    iter->second.sessions.insert(session_id);
    return true;
  }

  /// Participants other than the sender, or std::nullopt (error already sent) when not allowed
  auto recipients_in(const std::string &connection_id, const std::shared_ptr<Peer> &peer, const std::string &session_id)
    -> std::optional<std::vector<std::string>>
  {
    std::optional<std::vector<std::string>> others;
    const char *refusal = "Session not found";
    {
      const std::scoped_lock lock(sessions_mutex_);
      auto iter = sessions_.find(session_id);
      if (iter != sessions_.end()) {
        const auto &members = iter->second.participants;
        if (std::ranges::find(members, connection_id) == members.end()) {
          refusal = "Not in session";
        } else {
          others.emplace();
          std::ranges::copy_if(
            members, std::back_inserter(*others), [&](const auto &id) { return id != connection_id; });
        }
      }
    }

    if (not others) { peer->send_text(protocol::make_error(refusal, session_id)); }
    return others;
  }

  auto relay_signal(const std::string &connection_id, const std::shared_ptr<Peer> &peer, const protocol::signal &msg)
    -> void
  {
    auto recipients = recipients_in(connection_id, peer, msg.session_id);
    if (not recipients) { return; }

    if (msg.target_id and std::ranges::find(*recipients, *msg.target_id) != recipients->end()) {
      recipients = std::vector<std::string>{ *msg.target_id };
    }

    const auto text = protocol::make_signal(msg.message, connection_id);
    const auto delivered = send_to(*recipients, text);
    bytes_relayed_ += delivered * text.size();
  }

  auto broadcast(const std::string &connection_id, const std::shared_ptr<Peer> &peer, const protocol::broadcast &msg)
    -> void
  {
    const auto recipients = recipients_in(connection_id, peer, msg.session_id);
    if (not recipients) { return; }

    const auto text = protocol::make_broadcast(connection_id, msg.payload);
    const auto delivered = send_to(*recipients, text);
    bytes_relayed_ += delivered * text.size();
  }

  auto relay_data(const std::string &connection_id, const protocol::relay_data &msg) -> void
  {
    const auto text = protocol::make_relay_data(connection_id, msg.payload);
    if (send_to({ msg.target_id }, text) == 0) {
      spdlog::debug("[relay_engine] relay-data from {} dropped, {} not connected", connection_id, msg.target_id);
      return;
    }
    bytes_relayed_ += text.size();
  }

  auto relay_media(const std::string &connection_id, const protocol::relay_media &msg) -> void
  {
    const auto target = lookup(msg.target_id);
    if (not target or not target->peer->is_open()) {
      spdlog::trace("[relay_engine] relay-media from {} dropped, {} not connected", connection_id, msg.target_id);
      return;
    }
    bytes_relayed_ += msg.payload.size();
    target->peer->send_binary(msg.payload);
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<access::access_control> access_;
  std::chrono::milliseconds auth_timeout_;
  platform::wall_clock_t clock_;
  std::shared_ptr<event_queue_t> events_;

  mutable std::mutex connections_mutex_;
  std::map<std::string, connection_entry> connections_;

  mutable std::mutex sessions_mutex_;
  std::map<std::string, session_entry> sessions_;

  std::atomic<std::uint64_t> total_connections_{ 0 };
  std::atomic<std::uint64_t> total_sessions_{ 0 };
  std::atomic<std::uint64_t> bytes_relayed_{ 0 };
  mutable std::mutex stats_mutex_;
  std::chrono::system_clock::time_point started_at_;
};

}// namespace openlink_relay::relay
