#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <regex>
#include <string>

#include <platform/env_utils.hpp>
#include <platform/time_utils.hpp>

TEST_CASE("format_iso8601 renders UTC timestamps", "[platform][time]")
{
  const std::chrono::system_clock::time_point epoch{};
  CHECK(openlink_relay::platform::format_iso8601(epoch) == "1970-01-01T00:00:00Z");

  const auto later = epoch + std::chrono::seconds(1700000000);
  CHECK(openlink_relay::platform::format_iso8601(later) == "2023-11-14T22:13:20Z");

  const std::regex iso_pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}Z)");
  CHECK(std::regex_match(
    openlink_relay::platform::format_iso8601(openlink_relay::platform::system_wall_clock()()), iso_pattern));
}

TEST_CASE("to_unix_millis counts from the epoch", "[platform][time]")
{
  const std::chrono::system_clock::time_point epoch{};
  CHECK(openlink_relay::platform::to_unix_millis(epoch) == 0);
  CHECK(openlink_relay::platform::to_unix_millis(epoch + std::chrono::milliseconds(1700000000123)) == 1700000000123ULL);
}

TEST_CASE("system clocks move forward", "[platform][time]")
{
  const auto steady = openlink_relay::platform::system_steady_clock();
  const auto first = steady();
  CHECK(steady() >= first);
}

TEST_CASE("expand_tilde_path expands only a leading ~/", "[platform][env]")
{
  const auto home = openlink_relay::platform::get_home_directory();

  CHECK(openlink_relay::platform::expand_tilde_path("/etc/relay.json") == "/etc/relay.json");
  CHECK(openlink_relay::platform::expand_tilde_path("relative/~/path") == "relative/~/path");
  if (not home.empty()) {
    CHECK(openlink_relay::platform::expand_tilde_path("~/.openlink/relay.json") == home + "/.openlink/relay.json");
  }
}

TEST_CASE("default_store_path is absolute or home-relative", "[platform][env]")
{
  const auto path = openlink_relay::platform::default_store_path();
  CHECK_FALSE(path.empty());
  CHECK_FALSE(openlink_relay::platform::get_temp_directory().empty());
}
