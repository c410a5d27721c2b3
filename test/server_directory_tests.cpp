#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core/error.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <core/events.hpp>
#include <core/service_runner.hpp>
#include <directory/health.hpp>
#include <directory/server_directory.hpp>
#include <store/memory_store.hpp>

#include "test_doubles/test_double_http_client.hpp"

namespace {

using openlink_relay::directory::health_status;
using openlink_relay::directory::server_descriptor;
using openlink_relay::directory::server_kind;
using openlink_relay::test::fake_steady_clock;
using openlink_relay::test::test_double_http_client;
using directory_t = openlink_relay::directory::server_directory<test_double_http_client, openlink_relay::store::memory_store>;

constexpr auto fast_url = "ws://fast.example:8765";
constexpr auto slow_url = "ws://slow.example:8765";
constexpr auto down_url = "ws://down.example:8765";
constexpr auto community_url = "https://community.example/servers.json";

auto make_server(std::string name, std::string url) -> server_descriptor
{
  return server_descriptor{ .name = std::move(name),
    .url = std::move(url),
    .kind = server_kind::fallback,
    .region = "US",
    .features = { "signaling" },
    .address_kind = std::nullopt,
    .added_at = std::nullopt,
    .preference = openlink_relay::directory::server_preference::none };
}

struct directory_fixture
{
  std::shared_ptr<boost::asio::io_context> io_context = std::make_shared<boost::asio::io_context>();
  std::shared_ptr<fake_steady_clock> clock = std::make_shared<fake_steady_clock>();
  std::shared_ptr<test_double_http_client> client = std::make_shared<test_double_http_client>(clock);
  std::shared_ptr<openlink_relay::store::memory_store> store = std::make_shared<openlink_relay::store::memory_store>();

  [[nodiscard]] auto options() const -> openlink_relay::directory::directory_options
  {
    openlink_relay::directory::directory_options opts;
    opts.defaults = { make_server("Down", down_url), make_server("Slow", slow_url), make_server("Fast", fast_url) };
    opts.community_url = community_url;
    opts.max_concurrent_probes = 2;
    return opts;
  }

  [[nodiscard]] auto make_directory() const -> std::shared_ptr<directory_t>
  {
    return std::make_shared<directory_t>(io_context, client, store, options(), fake_steady_clock::source(clock));
  }

  template<typename T> auto run(boost::asio::awaitable<T> awaitable) -> T
  {
    auto future = boost::asio::co_spawn(*io_context, std::move(awaitable), boost::asio::use_future);
    io_context->restart();
    io_context->run();
    return future.get();
  }
};

}// namespace

SCENARIO("Best server selection prefers the lowest online latency", "[directory][best]")
{
  GIVEN("Two online servers at 40 ms and 90 ms and one offline server")
  {
    directory_fixture fixture;
    fixture.client->set_response("http://fast.example:8765/health", 200, R"({"status":"healthy"})", std::chrono::milliseconds(40));
    fixture.client->set_response("http://slow.example:8765/health", 200, R"({"status":"healthy"})", std::chrono::milliseconds(90));
    auto directory = fixture.make_directory();

    WHEN("asking for the best server")
    {
      const auto best = fixture.run(directory->get_best_server());

      THEN("the 40 ms server is chosen")
      {
        CHECK(best.url == fast_url);
        CHECK(directory->get_status(fast_url) == "online");
        CHECK(directory->get_status(slow_url) == "online");
        CHECK(directory->get_status(down_url) == "offline");
      }
    }
  }

  GIVEN("No server online")
  {
    directory_fixture fixture;
    auto directory = fixture.make_directory();

    WHEN("asking for the best server")
    {
      const auto best = fixture.run(directory->get_best_server());

      THEN("the first default is returned") { CHECK(best.url == down_url); }
    }
  }

  GIVEN("A saved server marked always that is online")
  {
    directory_fixture fixture;
    fixture.client->set_response("http://fast.example:8765/health", 200, "{}", std::chrono::milliseconds(40));
    fixture.client->set_response("https://pinned.example/health", 200, "{}", std::chrono::milliseconds(300));
    auto directory = fixture.make_directory();
    REQUIRE(directory->add_server("wss://pinned.example", "Pinned").success);
    REQUIRE(directory->set_preferred_server("wss://pinned.example", openlink_relay::directory::server_preference::always).success);

    WHEN("asking for the best server")
    {
      const auto best = fixture.run(directory->get_best_server());

      THEN("the preferred server wins without probing the rest")
      {
        CHECK(best.url == "wss://pinned.example");
        CHECK(fixture.client->requests().size() == 1);
      }
    }
  }
}

SCENARIO("Health probes classify every outcome", "[directory][health]")
{
  directory_fixture fixture;
  fixture.client->set_response("http://fast.example:8765/health", 200, "{}", std::chrono::milliseconds(12));
  fixture.client->set_response("http://slow.example:8765/health", 503, "");
  fixture.client->set_error("http://down.example:8765/health", boost::beast::error::timeout);
  auto directory = fixture.make_directory();

  THEN("a 200 is online with its latency")
  {
    const auto result = fixture.run(directory->check_health(fast_url));
    CHECK(result.status == health_status::online);
    CHECK(result.online);
    REQUIRE(result.latency_ms.has_value());
    CHECK(*result.latency_ms == 12);
  }

  THEN("any other status is degraded")
  {
    const auto result = fixture.run(directory->check_health(slow_url));
    CHECK(result.status == health_status::degraded);
    CHECK_FALSE(result.online);
  }

  THEN("a deadline expiry is a timeout")
  {
    CHECK(fixture.run(directory->check_health(down_url)).status == health_status::timeout);
  }

  THEN("a refused connection is offline")
  {
    CHECK(fixture.run(directory->check_health("wss://nobody.example")).status == health_status::offline);
  }

  THEN("a URL that is not a relay URL is an error")
  {
    const auto result = fixture.run(directory->check_health("ftp://files.example"));
    CHECK(result.status == health_status::error);
    CHECK(result.error.has_value());
  }

  THEN("the probe goes to the matching http(s) health endpoint")
  {
    (void)fixture.run(directory->check_health("wss://secure.example:9443"));
    const auto request = fixture.client->last_request();
    REQUIRE(request.has_value());
    CHECK(request->url == "https://secure.example:9443/health");
  }
}

SCENARIO("A probe sweep publishes status changes", "[directory][events]")
{
  GIVEN("A directory that has never probed")
  {
    directory_fixture fixture;
    fixture.client->set_response("http://fast.example:8765/health", 200, "{}", std::chrono::milliseconds(5));
    auto directory = fixture.make_directory();

    WHEN("every server is checked twice")
    {
      const auto outcomes = fixture.run(directory->check_all());
      (void)fixture.run(directory->check_all());

      THEN("one outcome per server is returned in directory order")
      {
        REQUIRE(outcomes.size() == 3);
        CHECK(outcomes[0].server.url == down_url);
        CHECK(outcomes[2].server.url == fast_url);
        CHECK(outcomes[2].health.online);
      }

      THEN("only the first sweep produced health_changed events")
      {
        std::size_t changes = 0;
        while (auto event = directory->events()->try_pop()) {
          if (const auto *changed = std::get_if<openlink_relay::core::events::directory::health_changed>(&*event)) {
            CHECK(changed->previous == "unknown");
            ++changes;
          }
        }
        CHECK(changes == 3);
      }
    }
  }
}

SCENARIO("Saved servers are managed idempotently", "[directory][saved]")
{
  GIVEN("An empty saved list")
  {
    directory_fixture fixture;
    auto directory = fixture.make_directory();

    WHEN("the same URL is added twice")
    {
      const auto first = directory->add_server("wss://mine.example:9000", "Mine");
      const auto second = directory->add_server("wss://mine.example:9000");

      THEN("the first succeeds and the second reports already exists")
      {
        CHECK(first.success);
        REQUIRE(first.server.has_value());
        CHECK(first.server->kind == server_kind::custom);
        CHECK(first.server->address_kind == openlink_relay::address::address_kind::domain);
        CHECK(first.server->added_at.has_value());

        CHECK_FALSE(second.success);
        CHECK(second.error == openlink_relay::directory::mutation_error::already_exists);
      }

      THEN("exactly one entry is saved and persisted")
      {
        CHECK(directory->get_saved_servers().size() == 1);
        const auto stored = fixture.store->get(openlink_relay::directory::saved_servers_key);
        REQUIRE(stored.has_value());
        CHECK(stored->size() == 1);
      }

      THEN("a new directory over the same store sees it")
      {
        auto reloaded = fixture.make_directory();
        REQUIRE(reloaded->get_saved_servers().size() == 1);
        CHECK(reloaded->get_saved_servers().front().name == "Mine");
        CHECK(reloaded->get_all_servers().size() == 4);
      }
    }

    WHEN("bare addresses are added")
    {
      const auto ipv4 = directory->add_server("203.0.113.7:8765");
      const auto ipv6 = directory->add_server("[2001:db8::1]:9000");
      const auto domain = directory->add_server("relay.example.com");

      THEN("they are saved as relay URLs")
      {
        REQUIRE(ipv4.server.has_value());
        CHECK(ipv4.server->url == "wss://203.0.113.7:8765");
        REQUIRE(ipv6.server.has_value());
        CHECK(ipv6.server->url == "wss://[2001:db8::1]:9000");
        REQUIRE(domain.server.has_value());
        CHECK(domain.server->url == "wss://relay.example.com");
      }

      THEN("the URL form of the same server is a duplicate")
      {
        CHECK(directory->add_server("wss://203.0.113.7:8765").error
              == openlink_relay::directory::mutation_error::already_exists);
      }

      THEN("the saved server can be probed")
      {
        fixture.client->set_response("https://203.0.113.7:8765/health", 200, "{}", std::chrono::milliseconds(8));
        const auto result = fixture.run(directory->check_health(ipv4.server->url));
        CHECK(result.status == health_status::online);
        CHECK(fixture.client->last_request()->url == "https://203.0.113.7:8765/health");
      }
    }

    WHEN("adding an unparseable address")
    {
      const auto result = directory->add_server("not a server");

      THEN("it is rejected") { CHECK(result.error == openlink_relay::directory::mutation_error::invalid_address); }
    }

    WHEN("removing a URL that was never saved")
    {
      const auto result = directory->remove_server("wss://ghost.example");

      THEN("not found is reported") { CHECK(result.error == openlink_relay::directory::mutation_error::not_found); }
    }
  }

  GIVEN("Two saved servers")
  {
    directory_fixture fixture;
    auto directory = fixture.make_directory();
    REQUIRE(directory->add_server("wss://a.example").success);
    REQUIRE(directory->add_server("wss://b.example").success);

    WHEN("both are marked always in turn")
    {
      (void)directory->set_preferred_server("wss://a.example", openlink_relay::directory::server_preference::always);
      (void)directory->set_preferred_server("wss://b.example", openlink_relay::directory::server_preference::always);

      THEN("only the last one keeps always")
      {
        const auto saved = directory->get_saved_servers();
        CHECK(saved[0].preference == openlink_relay::directory::server_preference::none);
        CHECK(saved[1].preference == openlink_relay::directory::server_preference::always);
      }
    }

    WHEN("one is removed")
    {
      const auto result = directory->remove_server("wss://a.example");

      THEN("the other remains")
      {
        CHECK(result.success);
        REQUIRE(directory->get_saved_servers().size() == 1);
        CHECK(directory->get_saved_servers().front().url == "wss://b.example");
      }
    }
  }
}

SCENARIO("Community servers are merged into the directory", "[directory][community]")
{
  GIVEN("A community list with a duplicate and an invalid entry")
  {
    directory_fixture fixture;
    fixture.client->set_response(community_url,
      200,
      R"({"servers":[{"name":"C1","url":"wss://c1.example"},{"url":"wss://c1.example"},{"name":"bad"}]})");
    auto directory = fixture.make_directory();

    WHEN("refreshing")
    {
      const bool refreshed = fixture.run(directory->refresh_community_servers());

      THEN("one community server is added")
      {
        CHECK(refreshed);
        const auto all = directory->get_all_servers();
        REQUIRE(all.size() == 4);
        CHECK(all[3].server.kind == server_kind::community);
        CHECK(all[3].status == "unknown");
      }
    }
  }

  GIVEN("An unreachable community source")
  {
    directory_fixture fixture;
    auto directory = fixture.make_directory();

    WHEN("refreshing")
    {
      const bool refreshed = fixture.run(directory->refresh_community_servers());

      THEN("the failure is published, not thrown")
      {
        CHECK_FALSE(refreshed);
        auto event = directory->events()->try_pop();
        REQUIRE(event.has_value());
        CHECK(std::holds_alternative<openlink_relay::core::events::directory::community_refresh_failed>(*event));
      }
    }
  }
}

SCENARIO("The directory runs as a background monitoring service", "[directory][service]")
{
  GIVEN("A directory spawned as a service")
  {
    directory_fixture fixture;
    fixture.client->set_response("http://fast.example:8765/health", 200, "{}", std::chrono::milliseconds(25));
    auto directory = fixture.make_directory();
    auto handle = openlink_relay::core::spawn_service(fixture.io_context, directory, "server_directory");

    WHEN("the io_context runs the ready work")
    {
      fixture.io_context->poll();

      THEN("one sweep has completed and the loop waits for the next interval")
      {
        CHECK(handle->started());
        CHECK_FALSE(handle->done());
        CHECK(directory->get_status(fast_url) == "online");
        CHECK(directory->get_status(down_url) == "offline");
      }

      AND_WHEN("the service is stopped")
      {
        handle->stop();
        fixture.io_context->run();

        THEN("the loop exits cleanly") { CHECK(handle->done()); }
      }
    }
  }
}

SCENARIO("A stopped directory service can be released while the community fetch is in flight", "[directory][service]")
{
  GIVEN("A directory service whose community list answers slowly")
  {
    directory_fixture fixture;
    fixture.client->set_deferred_response(
      community_url, 200, R"({"servers":[{"name":"Late","url":"wss://late.example"}]})", std::chrono::milliseconds(30));
    auto directory = fixture.make_directory();
    const auto events = directory->events();
    const std::weak_ptr<directory_t> observer = directory;
    auto handle = openlink_relay::core::spawn_service(fixture.io_context, directory, "server_directory");

    WHEN("the service is stopped and the owner lets go before the fetch completes")
    {
      fixture.io_context->poll();
      handle->stop();
      directory.reset();
      fixture.io_context->run();

      THEN("the fetch finishes on a live directory which is then released")
      {
        CHECK(handle->done());
        auto refreshed = 0;
        while (auto event = events->try_pop()) {
          if (std::holds_alternative<openlink_relay::core::events::directory::community_refreshed>(*event)) { ++refreshed; }
        }
        CHECK(refreshed == 1);
        CHECK(observer.expired());
      }
    }
  }
}
