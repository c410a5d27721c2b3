#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include <trust/host_trust_manager.hpp>
#include <trust/registry_messages.hpp>

#include "test_doubles/test_double_http_client.hpp"

namespace {

using manager_t = openlink_relay::trust::host_trust_manager<openlink_relay::test::test_double_http_client>;

constexpr auto reported_url = "wss://bad.example:8765";
constexpr auto report_endpoint = "https://raywonderis.me/openlink/api/report-host";
constexpr auto status_query = "https://raywonderis.me/openlink/api/host-status?url=wss%3A%2F%2Fbad.example%3A8765";
constexpr auto count_query = "https://raywonderis.me/openlink/api/host-reports?url=wss%3A%2F%2Fbad.example%3A8765";
constexpr auto register_endpoint = "https://raywonderis.me/openlink/register-host";

template<typename Awaitable> auto run_sync(Awaitable awaitable)
{
  auto io_context = std::make_shared<boost::asio::io_context>();
  auto future = boost::asio::co_spawn(*io_context, std::move(awaitable), boost::asio::use_future);
  io_context->run();
  return future.get();
}

auto fixed_clock() -> openlink_relay::platform::wall_clock_t
{
  return []() { return std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123)); };
}

}// namespace

SCENARIO("Reports are forwarded to the registry", "[trust][registry]")
{
  GIVEN("A registry that logs the report")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(report_endpoint, 200, R"({"success":true,"totalReports":2,"actionTaken":"logged"})");
    manager_t manager(client, {}, fixed_clock());

    WHEN("a host is reported")
    {
      const auto result = run_sync(manager.report_host(reported_url, "machine-1", "spam"));

      THEN("the registry's verdict is returned")
      {
        CHECK(result.success);
        CHECK(result.total_reports == 2U);
        CHECK(result.action_taken == "logged");
      }

      THEN("the payload carries the report and the ban policy")
      {
        const auto request = client->last_request();
        REQUIRE(request.has_value());
        CHECK(request->method == openlink_relay::transport::http_method::post);
        const auto payload = nlohmann::json::parse(request->body);
        CHECK(payload.at("hostUrl") == reported_url);
        CHECK(payload.at("reporterId") == "machine-1");
        CHECK(payload.at("reason") == "spam");
        CHECK(payload.at("action") == "report");
        CHECK(payload.at("timestamp") == 1700000000123ULL);
        CHECK(payload.at("threshold") == 3);
        CHECK(payload.at("banDurationHours") == 24);
      }
    }
  }

  GIVEN("A report that reaches the threshold")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(report_endpoint, 200, R"({"success":true,"totalReports":3,"actionTaken":"banned_and_alerted"})");
    manager_t manager(client);

    THEN("the ban is reported back")
    {
      const auto result = run_sync(manager.report_host(reported_url, "machine-3", "abuse"));
      CHECK(result.action_taken == "banned_and_alerted");
    }
  }

  GIVEN("An unreachable registry")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    manager_t manager(client);

    THEN("the report fails without throwing")
    {
      const auto result = run_sync(manager.report_host(reported_url, "machine-1", "spam"));
      CHECK_FALSE(result.success);
      CHECK(result.error.has_value());
    }
  }

  GIVEN("A registry answering with a server error page")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(report_endpoint, 500, "<html>oops</html>");
    manager_t manager(client);

    THEN("the report fails with the status")
    {
      const auto result = run_sync(manager.report_host(reported_url, "machine-1", "spam"));
      CHECK_FALSE(result.success);
      CHECK(result.error == "HTTP 500");
    }
  }
}

SCENARIO("Ban status and report counts degrade gracefully", "[trust][registry]")
{
  GIVEN("A registry that knows the host is banned")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(status_query, 200, R"({"banned":true,"expiresAt":1700086400000,"reason":"spam"})");
    client->set_response(count_query, 200, R"({"count":4})");
    manager_t manager(client);

    THEN("the status and count are returned")
    {
      const auto status = run_sync(manager.check_host_ban_status(reported_url));
      CHECK(status.banned);
      CHECK(status.expires_at == 1700086400000ULL);
      CHECK(status.reason == "spam");
      CHECK(run_sync(manager.get_host_report_count(reported_url)) == 4);
    }
  }

  GIVEN("An unreachable registry")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_error(status_query, boost::asio::error::timed_out);
    client->set_response(count_query, 503, "");
    manager_t manager(client);

    THEN("the host is treated as not banned with no reports")
    {
      const auto status = run_sync(manager.check_host_ban_status(reported_url));
      CHECK_FALSE(status.banned);
      CHECK(status.error.has_value());
      CHECK(run_sync(manager.get_host_report_count(reported_url)) == 0);
    }
  }

  GIVEN("Malformed replies")
  {
    THEN("they parse to safe defaults")
    {
      CHECK(openlink_relay::trust::parse_report_count(R"({"count":"many"})") == 0);
      CHECK(openlink_relay::trust::parse_ban_status("not json").error.has_value());
      CHECK_FALSE(openlink_relay::trust::parse_ban_status(R"({"banned":"yes"})").banned);
    }
  }
}

SCENARIO("Public hosts register and admins unban", "[trust][registry]")
{
  GIVEN("A registry accepting registrations and admin actions")
  {
    auto client = std::make_shared<openlink_relay::test::test_double_http_client>();
    client->set_response(register_endpoint, 200, R"({"success":true})");
    client->set_response(report_endpoint, 200, R"({"success":true,"actionTaken":"unbanned"})");
    manager_t manager(client);

    WHEN("a public relay registers")
    {
      const auto result = run_sync(manager.register_public_host(
        { .name = "Studio", .url = "wss://studio.example:8765", .region = "eu", .features = { "signaling", "relay", "turn" }, .public_key = {} }));

      THEN("the announcement carries its features")
      {
        CHECK(result.success);
        const auto payload = nlohmann::json::parse(client->last_request()->body);
        CHECK(payload.at("url") == "wss://studio.example:8765");
        CHECK(payload.at("features").size() == 3);
        CHECK_FALSE(payload.contains("publicKey"));
      }
    }

    WHEN("an admin lifts a ban")
    {
      const auto result = run_sync(manager.unban_host(reported_url, "secret-token"));

      THEN("the action is sent to the report endpoint")
      {
        CHECK(result.action_taken == "unbanned");
        const auto payload = nlohmann::json::parse(client->last_request()->body);
        CHECK(payload.at("action") == "unban");
        CHECK(payload.at("adminToken") == "secret-token");
      }
    }
  }
}
