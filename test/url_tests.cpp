#include <catch2/catch_test_macros.hpp>
#include <string>

#include <transport/url.hpp>

SCENARIO("parse_url splits relay and health URLs", "[transport][url]")
{
  GIVEN("A wss URL without a port")
  {
    const auto parts = openlink_relay::transport::parse_url("wss://openlink.example.org/relay?x=1#frag");

    THEN("the default port for the scheme is used")
    {
      REQUIRE(parts.has_value());
      CHECK(parts->scheme == "wss");
      CHECK(parts->host == "openlink.example.org");
      CHECK(parts->port == "443");
      CHECK_FALSE(parts->explicit_port);
      CHECK(parts->target == "/relay?x=1");
    }
  }

  GIVEN("An http URL with an explicit port and no path")
  {
    const auto parts = openlink_relay::transport::parse_url("HTTP://localhost:8765");

    THEN("the scheme is lowercased and the target is /")
    {
      REQUIRE(parts.has_value());
      CHECK(parts->scheme == "http");
      CHECK(parts->port == "8765");
      CHECK(parts->explicit_port);
      CHECK(parts->target == "/");
      CHECK(openlink_relay::transport::format_authority(*parts) == "localhost:8765");
    }
  }

  GIVEN("A bracketed IPv6 URL")
  {
    const auto parts = openlink_relay::transport::parse_url("ws://[2001:db8::1]:9000/health");

    THEN("the brackets are stripped from the host and restored in the authority")
    {
      REQUIRE(parts.has_value());
      CHECK(parts->host == "2001:db8::1");
      CHECK(parts->port == "9000");
      CHECK(openlink_relay::transport::format_authority(*parts) == "[2001:db8::1]:9000");
    }
  }

  GIVEN("Malformed URLs")
  {
    THEN("they are rejected")
    {
      CHECK_FALSE(openlink_relay::transport::parse_url("no-scheme.example.org").has_value());
      CHECK_FALSE(openlink_relay::transport::parse_url("ws://:8765").has_value());
      CHECK_FALSE(openlink_relay::transport::parse_url("ws://host:0").has_value());
      CHECK_FALSE(openlink_relay::transport::parse_url("ws://host:70000").has_value());
      CHECK_FALSE(openlink_relay::transport::parse_url("ws://[::1").has_value());
    }
  }
}

TEST_CASE("url_encode escapes reserved characters", "[transport][url]")
{
  CHECK(openlink_relay::transport::url_encode("_openlink.vitalik.eth") == "_openlink.vitalik.eth");
  CHECK(openlink_relay::transport::url_encode("wss://a b") == "wss%3A%2F%2Fa%20b");
}
