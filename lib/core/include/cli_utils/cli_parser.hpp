#pragma once

#include <CLI/CLI.hpp>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

namespace openlink_relay::cli_utils {

struct cli_args
{
  static constexpr std::uint16_t default_port{ 8765 };
  static constexpr int default_auth_timeout_seconds{ 30 };

  std::uint16_t port = default_port;
  std::string bind_host = "0.0.0.0";
  std::string store_path = platform::default_store_path();
  std::optional<std::string> host_name;
  std::optional<std::string> mode;
  std::optional<std::string> pin;
  std::optional<std::string> password;
  int auth_timeout_seconds = default_auth_timeout_seconds;
  std::optional<std::string> advertise_url;
  bool verbose = false;
  bool show_version = false;

  bool resolve_parsed = false;
  std::string resolve_address;

  bool check_parsed = false;
  std::string check_url;

  bool best_parsed = false;

  bool report_parsed = false;
  std::string report_url;
  std::string report_reason;
  std::string reporter_id = "openlink-relay-cli";
};

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void;

inline auto parse_cli_args(int argc, char **argv) -> cli_args
{
  cli_args args;
  CLI::App app{ "OpenLink Relay - signaling relay and server discovery", "openlink-relay" };

  setup_cli_app(app, args);

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    app.exit(e);
    std::exit(e.get_exit_code());// NOLINT(concurrency-mt-unsafe)
  }

  args.store_path = platform::expand_tilde_path(args.store_path);

  return args;
}

inline auto setup_cli_app(CLI::App &app, cli_args &args) -> void
{
  app.add_option("-p,--port", args.port, "Port to listen on");
  app.add_option("-b,--bind", args.bind_host, "Address to bind");
  app.add_option("-s,--store", args.store_path, "Path of the persisted state file");
  app.add_option("-n,--name", args.host_name, "Host name shown to connecting clients");
  app.add_option("-m,--mode", args.mode, "Access mode: public, pin, password, two-factor, whitelist")
    ->check(CLI::IsMember({ "public", "pin", "password", "two-factor", "2fa", "whitelist" }));
  app.add_option("--pin", args.pin, "PIN required in pin mode (4-8 digits)");
  app.add_option("--password", args.password, "Password required in password mode");
  app.add_option("--auth-timeout", args.auth_timeout_seconds, "Seconds a client has to authenticate")
    ->check(CLI::PositiveNumber);
  app.add_option("--advertise", args.advertise_url, "Public URL to register with the host registry");
  app.add_flag("-v,--verbose", args.verbose, "Enable verbose logging");
  app.add_flag("--version", args.show_version, "Show version information");

  auto *resolve_cmd = app.add_subcommand("resolve", "Parse an address and resolve Web3 domains");
  resolve_cmd->add_option("address", args.resolve_address, "IP, domain, ENS or Unstoppable name, or URL")->required();
  resolve_cmd->callback([&args]() { args.resolve_parsed = true; });

  auto *check_cmd = app.add_subcommand("check", "Probe a relay's health endpoint");
  check_cmd->add_option("url", args.check_url, "Relay URL (ws:// or wss://)")->required();
  check_cmd->callback([&args]() { args.check_parsed = true; });

  auto *best_cmd = app.add_subcommand("best", "Probe known relays and print the best one");
  best_cmd->callback([&args]() { args.best_parsed = true; });

  auto *report_cmd = app.add_subcommand("report", "Report a public host to the trust registry");
  report_cmd->add_option("url", args.report_url, "Host URL")->required();
  report_cmd->add_option("reason", args.report_reason, "Reason for the report")->required();
  report_cmd->add_option("--reporter", args.reporter_id, "Reporter identifier");
  report_cmd->callback([&args]() { args.report_parsed = true; });
}

inline auto validate_cli_args(const cli_args &args) -> bool
{
  if (args.mode == "pin" and not args.pin) {
    spdlog::error("--mode pin requires --pin");
    return false;
  }

  if (args.mode == "password" and not args.password) {
    spdlog::error("--mode password requires --password");
    return false;
  }

  if (args.report_parsed and args.report_reason.empty()) {
    spdlog::error("Report command requires a reason");
    return false;
  }

  return true;
}

[[nodiscard]] inline auto has_subcommand(const cli_args &args) -> bool
{
  return args.resolve_parsed or args.check_parsed or args.best_parsed or args.report_parsed;
}

}// namespace openlink_relay::cli_utils
