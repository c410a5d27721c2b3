#pragma once

#include <address/address.hpp>
#include <async/async_queue.hpp>
#include <concepts/http_client.hpp>
#include <concepts/key_value_store.hpp>
#include <core/events.hpp>
#include <directory/health.hpp>
#include <directory/server_descriptor.hpp>
#include <platform/time_utils.hpp>
#include <transport/http_types.hpp>

#include <algorithm>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace openlink_relay::directory {

/**
 * @brief Tunables for the server directory.
 */
struct directory_options
{
  std::vector<server_descriptor> defaults{ default_servers() };///< Built-in list, first is the last resort
  std::string community_url{ "https://raywonderis.me/openlink/servers.json" };///< Community list source
  std::chrono::milliseconds probe_timeout{ std::chrono::seconds(5) };///< Per-probe deadline
  std::chrono::milliseconds check_interval{ std::chrono::seconds(60) };///< Period of run()'s sweep
  std::size_t max_concurrent_probes{ 16 };///< Probes in flight during check_all()
  address::parse_options parse;///< Used to classify custom entries
};

/// Why a saved-list mutation was refused
enum class mutation_error : std::uint8_t { already_exists, not_found, invalid_address };

[[nodiscard]] inline auto to_string(mutation_error error) -> std::string_view
{
  switch (error) {
  case mutation_error::already_exists:
    return "Server already exists";
  case mutation_error::not_found:
    return "Server not found";
  case mutation_error::invalid_address:
    break;
  }
  return "Invalid server address";
}

/**
 * @brief Outcome of add_server(), remove_server() and set_preferred_server().
 */
struct mutation_result
{
  bool success{};
  std::optional<mutation_error> error;
  std::optional<server_descriptor> server;///< The affected entry on success
};

/**
 * @brief A probed server.
 */
struct probe_outcome
{
  server_descriptor server;
  health_result health;
};

/// Latency assumed for an online server that reported none
inline constexpr std::uint32_t missing_latency_ms{ 9999 };

/// Store key of the saved server list
inline constexpr const char *saved_servers_key{ "savedServers" };

/**
 * @brief Directory of known relay servers with health probing and selection.
 *
 * Holds the built-in defaults, the fetched community list and the operator's
 * saved list, plus the latest health status per URL. Status changes are published
 * as core::events::directory_event_t on events().
 *
 * @tparam HttpClient Type satisfying concepts::http_client
 * @tparam Store Type satisfying concepts::key_value_store
 */
template<concepts::http_client HttpClient, concepts::key_value_store Store>
class server_directory : public std::enable_shared_from_this<server_directory<HttpClient, Store>>
{
public:
  /**
   * @brief Constructs the directory and loads the saved list from the store.
   *
   * @param io_context io_context probes are spawned on
   * @param client HTTP client used for probes and the community list
   * @param store Persisted state
   * @param options Tunables
   * @param steady_clock Latency clock
   * @param wall_clock Source of added_at timestamps
   * @throws std::invalid_argument if options.defaults is empty
   */
  server_directory(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::shared_ptr<HttpClient> client,
    std::shared_ptr<Store> store,
    directory_options options = {},
    platform::steady_clock_t steady_clock = platform::system_steady_clock(),
    platform::wall_clock_t wall_clock = platform::system_wall_clock())
    : io_context_(io_context), client_(std::move(client)), store_(std::move(store)), options_(std::move(options)),
      steady_clock_(std::move(steady_clock)), wall_clock_(std::move(wall_clock)),
      events_(std::make_shared<async::async_queue<core::events::directory_event_t>>(io_context_))
  {
    if (options_.defaults.empty()) { throw std::invalid_argument("directory needs at least one default server"); }
    if (options_.max_concurrent_probes == 0) { options_.max_concurrent_probes = 1; }
    load_saved();
  }

  /**
   * @brief All known servers (defaults, community, saved) with their last status.
   */
  [[nodiscard]] auto get_all_servers() const -> std::vector<annotated_server>
  {
    const std::scoped_lock lock(mutex_);
    std::vector<annotated_server> all;
    all.reserve(options_.defaults.size() + community_.size() + saved_.size());
    for (const auto *list : { &options_.defaults, &community_, &saved_ }) {
      for (const auto &server : *list) { all.push_back({ .server = server, .status = status_label(server.url) }); }
    }
    return all;
  }

  [[nodiscard]] auto get_saved_servers() const -> std::vector<server_descriptor>
  {
    const std::scoped_lock lock(mutex_);
    return saved_;
  }

  /**
   * @brief Probes <url>/health once. Never throws.
   *
   * @param url Relay URL (ws:// or wss://)
   * @return Awaitable yielding the classified result
   */
  auto check_health(std::string url) -> boost::asio::awaitable<health_result>
  {
    static constexpr unsigned status_ok = 200;

    const auto target = health_url(url);
    if (not target) {
      co_return health_result{ .status = health_status::error, .latency_ms = {}, .online = false, .error = "Invalid server URL" };
    }

    const auto started = steady_clock_();
    health_result result;
    try {
      const auto response = co_await client_->request(transport::http_request{ .method = transport::http_method::get,
        .url = *target,
        .headers = {},
        .body = {},
        .timeout = options_.probe_timeout,
        .verify_peer = false });
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock_() - started);
      result.latency_ms = static_cast<std::uint32_t>(std::max<std::int64_t>(0, elapsed.count()));
      result.online = response.status == status_ok;
      result.status = result.online ? health_status::online : health_status::degraded;
    } catch (const boost::system::system_error &err) {
      result.status = err.code() == boost::beast::error::timeout ? health_status::timeout : health_status::offline;
      spdlog::debug("[server_directory] Health check failed for {}: {}", url, err.code().message());
    } catch (const std::exception &err) {
      result.status = health_status::error;
      result.error = err.what();
      spdlog::debug("[server_directory] Health check error for {}: {}", url, err.what());
    }
    co_return result;
  }

  /**
   * @brief Probes every known server, at most max_concurrent_probes at a time.
   *
   * Updates the status map and publishes health_changed for each change.
   *
   * @return Awaitable yielding one outcome per server, in get_all_servers() order
   */
  auto check_all() -> boost::asio::awaitable<std::vector<probe_outcome>>
  {
    auto servers = get_all_servers();
    std::vector<probe_outcome> outcomes;
    outcomes.reserve(servers.size());
    for (auto &entry : servers) { outcomes.push_back({ .server = std::move(entry.server), .health = {} }); }
    if (outcomes.empty()) { co_return outcomes; }

    using completion_t = std::pair<std::size_t, health_result>;
    auto completions = std::make_shared<async::async_queue<completion_t>>(io_context_, outcomes.size());

    std::size_t next = 0;
    auto launch = [this, &outcomes, &next, completions] {
      const auto index = next++;
      boost::asio::co_spawn(*io_context_,
        check_health(outcomes[index].server.url),
        [completions, index](const std::exception_ptr &failure, health_result result) {
          if (failure) { result = health_result{ .status = health_status::error, .latency_ms = {}, .online = false, .error = "probe failed" }; }
          completions->push(completion_t{ index, std::move(result) });
        });
    };

    while (next < outcomes.size() and next < options_.max_concurrent_probes) { launch(); }
    for (std::size_t received = 0; received < outcomes.size(); ++received) {
      auto [index, health] = co_await completions->pop();
      record(outcomes[index].server.url, health);
      outcomes[index].health = std::move(health);
      if (next < outcomes.size()) { launch(); }
    }

    co_return outcomes;
  }

  /**
   * @brief Picks the server to connect to. Never returns nothing.
   *
   * A saved server marked always wins if it is online. Otherwise every server is
   * probed and the online one with the lowest latency is chosen. If none is
   * online the first default is returned.
   */
  auto get_best_server() -> boost::asio::awaitable<server_descriptor>
  {
    std::optional<server_descriptor> preferred;
    {
      const std::scoped_lock lock(mutex_);
      auto iter = std::ranges::find_if(saved_, [](const auto &server) { return server.preference == server_preference::always; });
      if (iter != saved_.end()) { preferred = *iter; }
    }

    if (preferred) {
      const auto health = co_await check_health(preferred->url);
      record(preferred->url, health);
      if (health.status == health_status::online) { co_return *preferred; }
      spdlog::info("[server_directory] Preferred server {} is {}", preferred->url, to_string(health.status));
    }

    auto outcomes = co_await check_all();
    const probe_outcome *best = nullptr;
    for (const auto &outcome : outcomes) {
      if (outcome.health.status != health_status::online) { continue; }
      if (best == nullptr
          or outcome.health.latency_ms.value_or(missing_latency_ms) < best->health.latency_ms.value_or(missing_latency_ms)) {
        best = &outcome;
      }
    }

    if (best != nullptr) { co_return best->server; }

    spdlog::warn("[server_directory] No server online, falling back to {}", options_.defaults.front().url);
    co_return options_.defaults.front();
  }

  /**
   * @brief Adds a server to the saved list and persists it.
   *
   * @param url Server URL or bare address; a bare address is saved as its wss:// (or ws://) URL
   * @param name Display name, defaults to the parsed host
   * @return already_exists for a duplicate URL, invalid_address if the address cannot be parsed
   * @throws std::runtime_error if the store cannot persist
   */
  auto add_server(const std::string &url, std::optional<std::string> name = std::nullopt) -> mutation_result
  {
    const auto parsed = address::parse(url, options_.parse);
    if (parsed.kind == address::address_kind::unknown) {
      return { .success = false, .error = mutation_error::invalid_address, .server = std::nullopt };
    }

    auto server_url = address::to_server_url(parsed);

    const std::scoped_lock lock(mutex_);
    if (std::ranges::any_of(saved_, [&server_url](const auto &server) { return server.url == server_url; })) {
      return { .success = false, .error = mutation_error::already_exists, .server = std::nullopt };
    }

    server_descriptor server{ .name = name.value_or(parsed.host),
      .url = std::move(server_url),
      .kind = server_kind::custom,
      .region = {},
      .features = {},
      .address_kind = parsed.kind,
      .added_at = platform::to_unix_millis(wall_clock_()),
      .preference = server_preference::none };
    saved_.push_back(server);
    persist_saved();
    spdlog::info("[server_directory] Saved server {} ({})", server.url, address::to_string(parsed.kind));
    return { .success = true, .error = std::nullopt, .server = std::move(server) };
  }

  /**
   * @brief Removes a saved server and forgets its status.
   *
   * @return not_found if the URL is not in the saved list
   */
  auto remove_server(const std::string &url) -> mutation_result
  {
    const std::scoped_lock lock(mutex_);
    auto iter = std::ranges::find_if(saved_, [&url](const auto &server) { return server.url == url; });
    if (iter == saved_.end()) { return { .success = false, .error = mutation_error::not_found, .server = std::nullopt }; }

    auto removed = std::move(*iter);
    saved_.erase(iter);
    status_.erase(url);
    persist_saved();
    return { .success = true, .error = std::nullopt, .server = std::move(removed) };
  }

  /**
   * @brief Sets the selection preference of a saved server.
   *
   * Marking one server always clears always from the others.
   *
   * @return not_found if the URL is not in the saved list
   */
  auto set_preferred_server(const std::string &url, server_preference preference) -> mutation_result
  {
    const std::scoped_lock lock(mutex_);
    auto iter = std::ranges::find_if(saved_, [&url](const auto &server) { return server.url == url; });
    if (iter == saved_.end()) { return { .success = false, .error = mutation_error::not_found, .server = std::nullopt }; }

    if (preference == server_preference::always) {
      for (auto &server : saved_) {
        if (server.preference == server_preference::always) { server.preference = server_preference::none; }
      }
    }
    iter->preference = preference;
    persist_saved();
    return { .success = true, .error = std::nullopt, .server = *iter };
  }

  /**
   * @brief Fetches the community list. Failures are logged and published, never thrown.
   *
   * @return Awaitable yielding true if the list was replaced
   */
  auto refresh_community_servers() -> boost::asio::awaitable<bool>
  {
    static constexpr unsigned status_ok = 200;

    std::string failure;
    try {
      const auto response = co_await client_->request(transport::http_request{ .method = transport::http_method::get,
        .url = options_.community_url,
        .headers = { { "Accept", "application/json" } },
        .body = {},
        .timeout = std::chrono::seconds(10) });
      if (response.status == status_ok) {
        if (auto servers = parse_community_list(response.body)) {
          const auto count = servers->size();
          {
            const std::scoped_lock lock(mutex_);
            community_ = std::move(*servers);
          }
          spdlog::info("[server_directory] Loaded {} community servers", count);
          events_->push(core::events::directory::community_refreshed{ .count = count });
          co_return true;
        }
        failure = "malformed community list";
      } else {
        failure = fmt::format("HTTP {}", response.status);
      }
    } catch (const std::exception &err) {
      failure = err.what();
    }

    spdlog::warn("[server_directory] Community list fetch failed: {}", failure);
    events_->push(core::events::directory::community_refresh_failed{ .error_message = failure });
    co_return false;
  }

  /**
   * @brief Background loop: community refresh, an immediate sweep, then one per interval.
   *
   * The directory must be owned by a shared_ptr; the community refresh keeps it
   * alive until the fetch completes.
   *
   * @param cancel_slot Slot that stops the loop
   */
  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
  {
    boost::asio::co_spawn(
      *io_context_,
      [self = this->shared_from_this()]() -> boost::asio::awaitable<void> {
        co_await self->refresh_community_servers();
      },
      boost::asio::detached);

    boost::asio::steady_timer timer(*io_context_);
    while (true) {
      const auto outcomes = co_await check_all();
      const auto online = std::ranges::count_if(outcomes, [](const auto &outcome) { return outcome.health.online; });
      spdlog::debug("[server_directory] Health sweep: {}/{} online", online, outcomes.size());

      timer.expires_after(options_.check_interval);
      if (cancel_slot) {
        co_await timer.async_wait(boost::asio::bind_cancellation_slot(*cancel_slot, boost::asio::use_awaitable));
      } else {
        co_await timer.async_wait(boost::asio::use_awaitable);
      }
    }
  }

  /// Last status label for a URL, "unknown" if never probed
  [[nodiscard]] auto get_status(const std::string &url) const -> std::string
  {
    const std::scoped_lock lock(mutex_);
    return status_label(url);
  }

  [[nodiscard]] auto events() const -> std::shared_ptr<async::async_queue<core::events::directory_event_t>>
  {
    return events_;
  }

  [[nodiscard]] auto options() const -> const directory_options & { return options_; }

private:
  static auto parse_community_list(const std::string &body) -> std::optional<std::vector<server_descriptor>>
  {
    const auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() or not json.is_object() or not json.contains("servers") or not json["servers"].is_array()) {
      return std::nullopt;
    }

    std::vector<server_descriptor> servers;
    for (const auto &entry : json["servers"]) {
      auto server = server_from_json(entry);
      if (not server) { continue; }
      server->kind = server_kind::community;
      if (std::ranges::none_of(servers, [&server](const auto &known) { return known.url == server->url; })) {
        servers.push_back(std::move(*server));
      }
    }
    return servers;
  }

  auto status_label(const std::string &url) const -> std::string
  {
    auto iter = status_.find(url);
    return iter == status_.end() ? std::string("unknown") : std::string(to_string(iter->second));
  }

  auto record(const std::string &url, const health_result &health) -> void
  {
    std::string previous;
    {
      const std::scoped_lock lock(mutex_);
      previous = status_label(url);
      status_[url] = health.status;
    }
    const auto current = std::string(to_string(health.status));
    if (previous != current) {
      spdlog::debug("[server_directory] {} changed {} -> {}", url, previous, current);
      events_->push(core::events::directory::health_changed{
        .url = url, .previous = std::move(previous), .current = current, .latency_ms = health.latency_ms });
    }
  }

  auto load_saved() -> void
  {
    const auto stored = store_->get(saved_servers_key);
    if (not stored) { return; }
    if (not stored->is_array()) {
      spdlog::warn("[server_directory] Ignoring malformed {} entry", saved_servers_key);
      return;
    }
    for (const auto &entry : *stored) {
      if (auto server = server_from_json(entry)) {
        server->kind = server_kind::custom;
        saved_.push_back(std::move(*server));
      }
    }
    spdlog::debug("[server_directory] Loaded {} saved servers", saved_.size());
  }

  // Caller holds mutex_
  auto persist_saved() -> void
  {
    auto json = nlohmann::json::array();
    for (const auto &server : saved_) { json.push_back(to_json(server)); }
    store_->set(saved_servers_key, json);
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<HttpClient> client_;
  std::shared_ptr<Store> store_;
  directory_options options_;
  platform::steady_clock_t steady_clock_;
  platform::wall_clock_t wall_clock_;
  std::shared_ptr<async::async_queue<core::events::directory_event_t>> events_;

  mutable std::mutex mutex_;
  std::vector<server_descriptor> community_;
  std::vector<server_descriptor> saved_;
  std::unordered_map<std::string, health_status> status_;
};

}// namespace openlink_relay::directory
