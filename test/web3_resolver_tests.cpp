#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <address/resolution_error.hpp>
#include <address/web3_records.hpp>
#include <address/web3_resolver.hpp>

#include "test_doubles/test_double_http_client.hpp"

namespace {

using resolver_t = openlink_relay::address::web3_resolver<openlink_relay::test::test_double_http_client>;

constexpr auto ens_query = "https://cloudflare-dns.com/dns-query?name=_openlink.myrelay.eth&type=TXT";
constexpr auto registry_query = "https://resolve.unstoppabledomains.com/domains/myrelay.crypto";

auto resolve_sync(resolver_t &resolver, const std::string &host, openlink_relay::address::address_kind kind)
  -> std::string
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto future = boost::asio::co_spawn(*io_context, resolver.resolve(host, kind), boost::asio::use_future);
  io_context->run();
  return future.get();
}

auto failure_of(resolver_t &resolver, const std::string &host, openlink_relay::address::address_kind kind)
  -> std::optional<openlink_relay::address::resolution_failure>
{
  try {
    (void)resolve_sync(resolver, host, kind);
  } catch (const openlink_relay::address::resolution_error &e) {
    return e.failure();
  }
  return std::nullopt;
}

}// namespace

SCENARIO("ENS names resolve through DNS-over-HTTPS TXT records", "[address][web3][ens]")
{
  GIVEN("A DoH answer carrying an openlink= record")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(ens_query,
      200,
      R"({"Status":0,"Answer":[{"data":"\"v=spf1\""},{"data":"\"openlink=wss://relay.myrelay.org:9443\""}]})");
    resolver_t resolver(client);

    WHEN("resolving the name")
    {
      const auto endpoint = resolve_sync(resolver, "myrelay.eth", openlink_relay::address::address_kind::ens);

      THEN("the record's URL is returned")
      {
        CHECK(endpoint == "wss://relay.myrelay.org:9443");
        const auto request = client->last_request();
        REQUIRE(request.has_value());
        REQUIRE(request->headers.size() == 1);
        CHECK(request->headers.front().second == "application/dns-json");
      }
    }
  }

  GIVEN("An NXDOMAIN answer")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(ens_query, 200, R"({"Status":3})");
    resolver_t resolver(client);

    THEN("the name itself is used as a secure endpoint")
    {
      CHECK(resolve_sync(resolver, "myrelay.eth", openlink_relay::address::address_kind::ens) == "wss://myrelay.eth");
    }
  }

  GIVEN("A DoH server that is unreachable")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    resolver_t resolver(client);

    THEN("resolution fails with a network error")
    {
      CHECK(failure_of(resolver, "myrelay.eth", openlink_relay::address::address_kind::ens)
            == openlink_relay::address::resolution_failure::network_error);
    }
  }

  GIVEN("A DoH reply that is not JSON")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(ens_query, 200, "<html>oops</html>");
    resolver_t resolver(client);

    THEN("resolution fails with an invalid response")
    {
      CHECK(failure_of(resolver, "myrelay.eth", openlink_relay::address::address_kind::ens)
            == openlink_relay::address::resolution_failure::invalid_response);
    }
  }
}

SCENARIO("Unstoppable names resolve through the registry API", "[address][web3][unstoppable]")
{
  GIVEN("A registry record naming an OpenLink server")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(registry_query, 200, R"({"records":{"openlink.server":"wss://relay.example.net"}})");
    openlink_relay::address::resolver_options options;
    options.api_key = "secret-key";
    resolver_t resolver(client, options);

    WHEN("resolving the name")
    {
      const auto endpoint =
        resolve_sync(resolver, "myrelay.crypto", openlink_relay::address::address_kind::unstoppable);

      THEN("the server record wins and the API key is sent")
      {
        CHECK(endpoint == "wss://relay.example.net");
        const auto request = client->last_request();
        REQUIRE(request.has_value());
        REQUIRE(request->headers.size() == 2);
        CHECK(request->headers.back().first == "Authorization");
        CHECK(request->headers.back().second == "Bearer secret-key");
      }
    }
  }

  GIVEN("A registry 404")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(registry_query, 404, R"({"message":"not found"})");
    resolver_t resolver(client);

    THEN("the domain is reported as not found")
    {
      CHECK(failure_of(resolver, "myrelay.crypto", openlink_relay::address::address_kind::unstoppable)
            == openlink_relay::address::resolution_failure::domain_not_found);
    }
  }

  GIVEN("A registry server error")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(registry_query, 503, "");
    resolver_t resolver(client);

    THEN("the failure is a network error")
    {
      CHECK(failure_of(resolver, "myrelay.crypto", openlink_relay::address::address_kind::unstoppable)
            == openlink_relay::address::resolution_failure::network_error);
    }
  }
}

TEST_CASE("Registry records fall back to IPFS hosting", "[address][web3]")
{
  CHECK(openlink_relay::address::endpoint_from_registry_records(R"({"records":{"ipfs.html.value":"Qm..."}})", "a.nft")
        == "wss://a.nft");
  CHECK_THROWS_AS(openlink_relay::address::endpoint_from_registry_records(R"({"records":{}})", "a.nft"),
    openlink_relay::address::resolution_error);
  CHECK_THROWS_AS(openlink_relay::address::endpoint_from_registry_records(R"({"meta":{}})", "a.nft"),
    openlink_relay::address::resolution_error);
}

TEST_CASE("Non-Web3 kinds cannot be resolved", "[address][web3]")
{
  auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
  resolver_t resolver(client);

  CHECK_THROWS_AS(resolve_sync(resolver, "example.com", openlink_relay::address::address_kind::domain), std::invalid_argument);
}

TEST_CASE("build_server_url leaves literal addresses alone", "[address][web3]")
{
  auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
  client->set_response(ens_query, 200, R"({"Status":0,"Answer":[{"data":"openlink=wss://r.example"}]})");
  resolver_t resolver(client);

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto literal = boost::asio::co_spawn(*io_context, resolver.build_server_url("ws://10.0.0.2:8765"), boost::asio::use_future);
  auto web3 = boost::asio::co_spawn(*io_context, resolver.build_server_url("myrelay.eth"), boost::asio::use_future);
  io_context->run();

  CHECK(literal.get() == "ws://10.0.0.2:8765");
  CHECK(web3.get() == "wss://r.example");
  CHECK(client->requests().size() == 1);
}
