#include "commands.hpp"

#include <address/address.hpp>
#include <address/resolution_error.hpp>
#include <address/web3_resolver.hpp>
#include <directory/health.hpp>
#include <directory/server_directory.hpp>
#include <trust/host_trust_manager.hpp>

#include <fmt/core.h>
#include <memory>
#include <spdlog/spdlog.h>

namespace openlink_relay::app {

namespace {

  using directory_t = directory::server_directory<transport::http_client, store::json_file_store>;

  auto resolve(const std::string &input, const command_context &context) -> boost::asio::awaitable<int>
  {
    const auto parsed = address::parse(input);
    fmt::print("Address: {}\n", parsed.original);
    fmt::print("Kind:    {}\n", address::to_string(parsed.kind));
    fmt::print("Host:    {}\n", parsed.host);
    fmt::print("Port:    {}\n", parsed.port);

    if (parsed.kind == address::address_kind::unknown) { co_return 1; }
    if (not parsed.requires_resolution) {
      const auto host = parsed.kind == address::address_kind::ipv6 ? fmt::format("[{}]", parsed.host) : parsed.host;
      fmt::print("URL:     {}://{}:{}\n", parsed.protocol, host, parsed.port);
      co_return 0;
    }

    address::web3_resolver<transport::http_client> resolver(context.client);
    try {
      const auto endpoint = co_await resolver.resolve(parsed.host, parsed.kind);
      fmt::print("URL:     {}\n", endpoint);
    } catch (const address::resolution_error &e) {
      spdlog::error("Resolution of {} failed ({}): {}", parsed.host, address::to_string(e.failure()), e.what());
      co_return 1;
    }
    co_return 0;
  }

  auto check(const std::string &url, const command_context &context) -> boost::asio::awaitable<int>
  {
    auto servers = std::make_shared<directory_t>(context.io_context, context.client, context.store);
    const auto result = co_await servers->check_health(url);

    fmt::print("{}: {}", url, directory::to_string(result.status));
    if (result.latency_ms) { fmt::print(" ({} ms)", *result.latency_ms); }
    if (result.error) { fmt::print(" - {}", *result.error); }
    fmt::print("\n");
    co_return result.online ? 0 : 1;
  }

  auto best(const command_context &context) -> boost::asio::awaitable<int>
  {
    auto servers = std::make_shared<directory_t>(context.io_context, context.client, context.store);
    co_await servers->refresh_community_servers();
    const auto outcomes = co_await servers->check_all();
    for (const auto &outcome : outcomes) {
      fmt::print("  {:<28} {:<10} {}\n",
        outcome.server.name,
        directory::to_string(outcome.health.status),
        outcome.health.latency_ms ? fmt::format("{} ms", *outcome.health.latency_ms) : std::string("-"));
    }

    const auto chosen = co_await servers->get_best_server();
    fmt::print("Best: {} ({})\n", chosen.name, chosen.url);
    co_return 0;
  }

  auto report(const cli_utils::cli_args &args, const command_context &context) -> boost::asio::awaitable<int>
  {
    trust::host_trust_manager<transport::http_client> registry(context.client);
    const auto result = co_await registry.report_host(args.report_url, args.reporter_id, args.report_reason);
    if (not result.success) {
      fmt::print("Report failed: {}\n", result.error.value_or("unknown error"));
      co_return 1;
    }

    fmt::print("Reported {}", args.report_url);
    if (result.total_reports) { fmt::print(", {} report(s) on record", *result.total_reports); }
    if (result.action_taken) { fmt::print(", action: {}", *result.action_taken); }
    fmt::print("\n");

    const auto status = co_await registry.check_host_ban_status(args.report_url);
    if (status.banned) { fmt::print("Host is banned: {}\n", status.reason.value_or("no reason given")); }
    co_return 0;
  }

}// namespace

auto run_command(const cli_utils::cli_args &args, command_context context) -> boost::asio::awaitable<int>
{
  if (args.resolve_parsed) { co_return co_await resolve(args.resolve_address, context); }
  if (args.check_parsed) { co_return co_await check(args.check_url, context); }
  if (args.best_parsed) { co_return co_await best(context); }
  if (args.report_parsed) { co_return co_await report(args, context); }
  co_return 0;
}

}// namespace openlink_relay::app
