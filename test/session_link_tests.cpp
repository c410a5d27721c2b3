#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cctype>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <core/id_generator.hpp>
#include <core/secure_random.hpp>
#include <relay/session_link.hpp>

namespace relay_link = openlink_relay::relay;

SCENARIO("Shareable links round-trip through the domain pool", "[relay][link]")
{
  const auto domains = relay_link::default_link_domains();

  GIVEN("A session id and a preferred pool domain")
  {
    const auto shared = relay_link::generate_shareable_link(domains, std::string("abc123"), std::string("openlink.tappedin.fm"));

    THEN("the link uses that domain")
    {
      CHECK(shared.url == "https://openlink.tappedin.fm/abc123");
      CHECK(shared.short_url == "openlink.tappedin.fm/abc123");
      CHECK(shared.domain == "openlink.tappedin.fm");
    }

    THEN("parsing the link yields the id and domain")
    {
      const auto parsed = relay_link::parse_shareable_link(shared.url, domains);
      REQUIRE(parsed.has_value());
      CHECK(parsed->session_id == "abc123");
      CHECK(parsed->domain == "openlink.tappedin.fm");
    }
  }

  GIVEN("A preferred domain outside the pool")
  {
    const auto shared = relay_link::generate_shareable_link(domains, std::string("room"), std::string("evil.example"));

    THEN("a pool domain is used instead")
    {
      CHECK(std::ranges::find(domains, shared.domain) != domains.end());
    }
  }

  GIVEN("No session id")
  {
    const auto shared = relay_link::generate_shareable_link(domains);

    THEN("a fresh URL-safe id is generated")
    {
      CHECK(relay_link::is_valid_session_id(shared.session_id));
      CHECK(shared.url == "https://" + shared.domain + "/" + shared.session_id);
    }
  }

  THEN("invalid input is refused")
  {
    CHECK_THROWS_AS(relay_link::generate_shareable_link({}, std::string("abc")), std::invalid_argument);
    CHECK_THROWS_AS(relay_link::generate_shareable_link(domains, std::string("a/b")), std::invalid_argument);
  }
}

TEST_CASE("Link parsing accepts the documented forms only", "[relay][link]")
{
  const auto domains = relay_link::default_link_domains();

  CHECK(relay_link::parse_shareable_link("openlink.devinecreations.net/room-1", domains)->session_id == "room-1");
  CHECK(relay_link::parse_shareable_link("http://OpenLink.TappedIn.fm/room-1/", domains)->domain == "openlink.tappedin.fm");
  CHECK_FALSE(relay_link::parse_shareable_link("https://other.example/room-1", domains).has_value());
  CHECK_FALSE(relay_link::parse_shareable_link("https://openlink.tappedin.fm/", domains).has_value());
  CHECK_FALSE(relay_link::parse_shareable_link("https://openlink.tappedin.fm/a/b", domains).has_value());
  CHECK_FALSE(relay_link::parse_shareable_link("openlink.tappedin.fm", domains).has_value());
}

TEST_CASE("Session ids are 1-64 URL-safe characters", "[relay][link]")
{
  CHECK(relay_link::is_valid_session_id("a"));
  CHECK(relay_link::is_valid_session_id("Ab_9-z"));
  CHECK(relay_link::is_valid_session_id(std::string(64, 'x')));
  CHECK_FALSE(relay_link::is_valid_session_id(""));
  CHECK_FALSE(relay_link::is_valid_session_id(std::string(65, 'x')));
  CHECK_FALSE(relay_link::is_valid_session_id("with space"));
  CHECK_FALSE(relay_link::is_valid_session_id("slash/"));
}

TEST_CASE("Generated session ids have the documented shape", "[core][id]")
{
  using openlink_relay::core::id_generator;

  std::set<std::string> seen;
  for (int i = 0; i < 200; ++i) {
    const auto id = id_generator::session_id();
    seen.insert(id);

    const auto body = std::ranges::count_if(id, [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; });
    CHECK(static_cast<std::size_t>(body) >= id_generator::session_id_min_body);
    CHECK(static_cast<std::size_t>(body) <= id_generator::session_id_max_body);
    CHECK(id.size() >= id_generator::session_id_min_length);
    CHECK(id.size() <= id_generator::session_id_max_length);

    REQUIRE_FALSE(id.empty());
    CHECK(std::isalnum(static_cast<unsigned char>(id.front())) != 0);
    CHECK(std::isalnum(static_cast<unsigned char>(id.back())) != 0);
    CHECK(id.find("--") == std::string::npos);
    CHECK(id.find("__") == std::string::npos);
    CHECK(id.find("-_") == std::string::npos);
    CHECK(id.find("_-") == std::string::npos);
    CHECK(relay_link::is_valid_session_id(id));
  }
  CHECK(seen.size() == 200);

  const auto connection = id_generator::connection_id();
  CHECK(connection.starts_with("c_"));
  CHECK(connection.size() == 38);
  CHECK(connection != id_generator::connection_id());
}

TEST_CASE("Secure random helpers respect their bounds", "[core][random]")
{
  CHECK(openlink_relay::core::random_bytes(20).size() == 20);

  for (int i = 0; i < 100; ++i) { CHECK(openlink_relay::core::random_index(3) < 3); }

  const auto digits = openlink_relay::core::random_digits(8);
  CHECK(digits.size() == 8);
  CHECK(std::ranges::all_of(digits, [](char c) { return c >= '0' and c <= '9'; }));
}
