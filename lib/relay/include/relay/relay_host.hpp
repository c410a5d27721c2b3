#pragma once

#include <access/access_config.hpp>
#include <access/access_control.hpp>
#include <async/async_queue.hpp>
#include <concepts/key_value_store.hpp>
#include <core/events.hpp>
#include <platform/time_utils.hpp>
#include <relay/relay_engine.hpp>
#include <relay/relay_gateway.hpp>
#include <relay/relay_options.hpp>
#include <relay/session_link.hpp>
#include <transport/listener.hpp>
#include <transport/websocket_peer.hpp>
#include <trust/verification_profile.hpp>

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace openlink_relay::relay {

/// Persisted-store key of the access configuration
inline constexpr const char *access_config_key = "accessConfig";
/// Persisted-store key of the verification profile
inline constexpr const char *verification_key = "verification";

/// Snapshot returned by relay_host::get_status()
struct relay_status
{
  bool running{};
  std::uint16_t port{};
  std::string bind_host;
  std::size_t connections{};
  std::size_t sessions{};
  std::uint64_t total_connections{};
  std::uint64_t total_sessions{};
  std::uint64_t bytes_relayed{};
  std::chrono::seconds uptime{};
  access::access_mode mode{};
  bool is_public{};
};

/// Operator-facing view of the configuration; secrets are reduced to flags
struct relay_config_view
{
  std::uint16_t port{};
  std::string bind_host;
  std::chrono::milliseconds auth_timeout{};
  std::vector<std::string> link_domains;
  access::access_mode mode{};
  bool is_public{};
  std::optional<std::string> host_name;
  bool has_pin{};
  bool has_password{};
  bool two_factor_enabled{};
  bool connection_pin_required{};
  std::vector<std::string> allowed_ips;
  std::vector<std::string> denied_ips;
  std::size_t max_connections{};
  std::size_t max_sessions_per_client{};
};

/// Verification profile with its derived trust data
struct verification_summary
{
  trust::verification_profile profile;
  std::uint32_t trust_score{};
  trust::trust_level level{};
  std::vector<trust::verification_link> links;
};

/**
 * @brief Control surface of the relay: lifecycle, access policy, verification
 * profile and shareable links.
 *
 * Access configuration and the verification profile are loaded from the store
 * at construction and written back after every change.
 *
 * @tparam Store Type satisfying concepts::key_value_store
 */
template<concepts::key_value_store Store> class relay_host
{
public:
  using engine_t = relay_engine<transport::websocket_peer>;
  using event_queue_t = async::async_queue<core::events::relay_event_t>;

  relay_host(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<Store> store,
    relay_options options = {},
    platform::wall_clock_t clock = platform::system_wall_clock())
    : io_context_(io_context), store_(std::move(store)), options_(std::move(options)), clock_(std::move(clock)),
      events_(std::make_shared<event_queue_t>(io_context_))
  {
    access::access_config config;
    if (auto stored = store_->get(access_config_key)) { config = access::access_config_from_json(*stored); }
    access_ = std::make_shared<access::access_control>(std::move(config), clock_);
    access_->on_connection_pin_rotated(
      [store = store_, store_mutex = store_mutex_, events = events_](
        const std::string &pin, const access::access_config &updated) {
        {
          const std::scoped_lock lock(*store_mutex);
          store->set(access_config_key, access::to_json(updated));
        }
        events->push(core::events::relay::connection_pin_rotated{ .pin = pin });
      });

    if (auto stored = store_->get(verification_key)) { profile_ = trust::verification_profile_from_json(*stored); }
  }

  relay_host(const relay_host &) = delete;
  auto operator=(const relay_host &) -> relay_host & = delete;
  relay_host(relay_host &&) = delete;
  auto operator=(relay_host &&) -> relay_host & = delete;

  ~relay_host()
  {
    if (listener_) { stop(); }
  }

  /**
   * @brief Starts listening.
   *
   * @param port Port override, 0 for an ephemeral port
   * @param bind_host Bind address override
   * @return The bound port
   * @throws std::logic_error if already running
   * @throws boost::system::system_error if the address cannot be bound
   */
  auto start(std::optional<std::uint16_t> port = std::nullopt, std::optional<std::string> bind_host = std::nullopt)
    -> std::uint16_t
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    if (listener_) { throw std::logic_error("relay host is already running"); }

    if (port) { options_.port = *port; }
    if (bind_host) { options_.bind_host = std::move(*bind_host); }

    if (access_->take_public_warning()) {
      spdlog::warn("[relay_host] This relay is PUBLIC: anyone who knows the address can connect.");
      spdlog::warn("[relay_host] Set a PIN, password or 2FA to restrict access.");
      persist_access();
    }

    engine_ = std::make_shared<engine_t>(io_context_, access_, options_.auth_timeout, clock_, events_);
    auto gateway = std::make_shared<relay_gateway>(engine_, clock_);
    auto listener = std::make_shared<transport::listener<relay_gateway>>(io_context_, gateway);

    try {
      bound_port_ = listener->start(options_.bind_host, options_.port);
    } catch (const std::exception &e) {
      spdlog::error("[relay_host] Failed to listen on {}:{}: {}", options_.bind_host, options_.port, e.what());
      engine_.reset();
      throw;
    }
    listener_ = std::move(listener);

    spdlog::info("[relay_host] Relay running on {}:{} ({} access)",
      options_.bind_host,
      bound_port_,
      access::to_string(access_->config().mode));
    events_->push(core::events::relay::started{ .bind_host = options_.bind_host, .port = bound_port_ });
    return bound_port_;
  }

  /// Stops listening and closes every connection; does nothing when stopped
  auto stop() -> void
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    if (not listener_) { return; }

    listener_->stop();
    listener_.reset();
    engine_->close_all();
    bound_port_ = 0;

    spdlog::info("[relay_host] Relay stopped");
    events_->push(core::events::relay::stopped{});
  }

  [[nodiscard]] auto is_running() const -> bool
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    return listener_ != nullptr;
  }

  /**
   * @brief Replaces the relay options. Port, bind address and auth timeout
   * take effect at the next start.
   */
  auto configure(relay_options options) -> void
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    if (options.link_domains.empty()) { options.link_domains = default_link_domains(); }
    options_ = std::move(options);
    spdlog::debug("[relay_host] Options updated (port {}, bind {})", options_.port, options_.bind_host);
  }

  [[nodiscard]] auto get_status() const -> relay_status
  {
    const auto config = access_->config();
    const std::scoped_lock lock(lifecycle_mutex_);

    relay_status status;
    status.running = listener_ != nullptr;
    status.port = bound_port_;
    status.bind_host = options_.bind_host;
    status.mode = config.mode;
    status.is_public = config.is_public;
    if (engine_) {
      const auto stats = engine_->stats();
      status.connections = stats.connections;
      status.sessions = stats.sessions;
      status.total_connections = stats.total_connections;
      status.total_sessions = stats.total_sessions;
      status.bytes_relayed = stats.bytes_relayed;
      if (status.running) {
        status.uptime = std::chrono::duration_cast<std::chrono::seconds>(clock_() - stats.started_at);
      }
    }
    return status;
  }

  [[nodiscard]] auto get_config() const -> relay_config_view
  {
    const auto config = access_->config();
    const std::scoped_lock lock(lifecycle_mutex_);
    return relay_config_view{ .port = options_.port,
      .bind_host = options_.bind_host,
      .auth_timeout = options_.auth_timeout,
      .link_domains = options_.link_domains,
      .mode = config.mode,
      .is_public = config.is_public,
      .host_name = config.host_name,
      .has_pin = config.pin_code.has_value(),
      .has_password = config.password.has_value(),
      .two_factor_enabled = config.two_factor_enabled,
      .connection_pin_required = config.connection_pin.required,
      .allowed_ips = config.allowed_ips,
      .denied_ips = config.denied_ips,
      .max_connections = config.max_connections,
      .max_sessions_per_client = config.max_sessions_per_client };
  }

  /// Current session snapshot, std::nullopt when stopped or unknown
  [[nodiscard]] auto session(const std::string &session_id) const -> std::optional<session_info>
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    if (not engine_) { return std::nullopt; }
    return engine_->session(session_id);
  }

  // Access policy

  auto set_pin_code(const std::string &pin) -> access::operation_result
  {
    return persisted(access_->set_pin_code(pin));
  }

  auto set_password(std::string_view password) -> access::operation_result
  {
    return persisted(access_->set_password(password));
  }

  auto enable_2fa() -> access::two_factor_setup
  {
    auto setup = access_->enable_2fa();
    persist_access();
    spdlog::info("[relay_host] Two-factor authentication enabled");
    return setup;
  }

  auto set_public() -> void
  {
    access_->set_public();
    persist_access();
  }

  auto set_private() -> void
  {
    access_->set_private();
    persist_access();
  }

  auto set_whitelist_mode() -> void
  {
    access_->set_whitelist_mode();
    persist_access();
  }

  auto set_connection_pin(const std::string &pin, access::connection_pin_options options = {})
    -> access::connection_pin_result
  {
    return persisted(access_->set_connection_pin(pin, options));
  }

  auto generate_connection_pin(std::size_t digits = access::access_control::default_pin_digits,
    access::connection_pin_options options = {}) -> access::connection_pin_result
  {
    return persisted(access_->generate_connection_pin(digits, options));
  }

  auto clear_connection_pin() -> void
  {
    access_->clear_connection_pin();
    persist_access();
  }

  auto allow_ip(const std::string &client_ip) -> void
  {
    access_->allow_ip(client_ip);
    persist_access();
  }

  auto remove_allowed_ip(const std::string &client_ip) -> void
  {
    access_->remove_allowed_ip(client_ip);
    persist_access();
  }

  auto deny_ip(const std::string &client_ip) -> void
  {
    access_->deny_ip(client_ip);
    persist_access();
  }

  auto remove_denied_ip(const std::string &client_ip) -> void
  {
    access_->remove_denied_ip(client_ip);
    persist_access();
  }

  auto set_host_name(std::optional<std::string> host_name) -> void
  {
    access_->set_host_name(std::move(host_name));
    persist_access();
  }

  auto set_limits(std::size_t max_connections, std::size_t max_sessions_per_client) -> void
  {
    access_->set_limits(max_connections, max_sessions_per_client);
    persist_access();
  }

  [[nodiscard]] auto access_policy() const -> std::shared_ptr<access::access_control> { return access_; }

  // Verification profile

  auto set_mastodon(const std::string &handle, std::optional<std::string> url = std::nullopt) -> trust::edit_result
  {
    return edit_profile([&](auto &profile) { return trust::set_mastodon(profile, handle, std::move(url)); });
  }

  auto set_social_links(const trust::social_links &links) -> void
  {
    edit_profile([&](auto &profile) {
      trust::set_social_links(profile, links);
      return trust::edit_result{ .success = true, .error = std::nullopt };
    });
  }

  auto add_custom_link(std::string name, std::string url) -> trust::edit_result
  {
    const auto now = platform::to_unix_millis(clock_());
    return edit_profile(
      [&](auto &profile) { return trust::add_custom_link(profile, std::move(name), std::move(url), now); });
  }

  auto set_organization(std::string name, bool verified) -> void
  {
    edit_profile([&](auto &profile) {
      trust::set_organization(profile, std::move(name), verified);
      return trust::edit_result{ .success = true, .error = std::nullopt };
    });
  }

  /// Profile with trust score and level computed from its current contents
  [[nodiscard]] auto verification_info() const -> verification_summary
  {
    const std::scoped_lock lock(profile_mutex_);
    const auto score = trust::trust_score(profile_);
    return verification_summary{ .profile = profile_,
      .trust_score = score,
      .level = trust::trust_level_for(score),
      .links = trust::verification_links(profile_) };
  }

  // Shareable links

  [[nodiscard]] auto generate_shareable_link(std::optional<std::string> session_id = std::nullopt,
    const std::optional<std::string> &preferred_domain = std::nullopt) const -> shareable_link
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    return relay::generate_shareable_link(options_.link_domains, std::move(session_id), preferred_domain);
  }

  [[nodiscard]] auto parse_shareable_link(std::string_view link) const -> std::optional<parsed_link>
  {
    const std::scoped_lock lock(lifecycle_mutex_);
    return relay::parse_shareable_link(link, options_.link_domains);
  }

  /// Outbound lifecycle notifications, shared across restarts
  [[nodiscard]] auto events() const -> std::shared_ptr<event_queue_t> { return events_; }

private:
  template<typename Result> auto persisted(Result result) -> Result
  {
    if (result.success) { persist_access(); }
    return result;
  }

  auto persist_access() -> void
  {
    const std::scoped_lock lock(*store_mutex_);
    store_->set(access_config_key, access::to_json(access_->config()));
  }

  template<typename Edit> auto edit_profile(Edit &&edit) -> trust::edit_result
  {
    nlohmann::json snapshot;
    trust::edit_result result;
    {
      const std::scoped_lock lock(profile_mutex_);
      result = std::forward<Edit>(edit)(profile_);
      if (not result.success) { return result; }
      snapshot = trust::to_json(profile_);
    }
    const std::scoped_lock lock(*store_mutex_);
    store_->set(verification_key, snapshot);
    return result;
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Store> store_;
  std::shared_ptr<std::mutex> store_mutex_{ std::make_shared<std::mutex>() };
  relay_options options_;
  platform::wall_clock_t clock_;
  std::shared_ptr<event_queue_t> events_;
  std::shared_ptr<access::access_control> access_;

  mutable std::mutex lifecycle_mutex_;
  std::shared_ptr<engine_t> engine_;
  std::shared_ptr<transport::listener<relay_gateway>> listener_;
  std::uint16_t bound_port_{ 0 };

  mutable std::mutex profile_mutex_;
  trust::verification_profile profile_;
};

}// namespace openlink_relay::relay
