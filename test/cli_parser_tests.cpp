#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

#include <cli_utils/cli_parser.hpp>

namespace {

auto parse(std::vector<std::string> args) -> openlink_relay::cli_utils::cli_args
{
  args.insert(args.begin(), "openlink-relay");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) { argv.push_back(arg.data()); }
  return openlink_relay::cli_utils::parse_cli_args(static_cast<int>(argv.size()), argv.data());
}

}// namespace

TEST_CASE("Relay options parse from the command line", "[cli_utils][cli_parser]")
{
  SECTION("defaults describe a public relay on 8765")
  {
    const auto parsed = parse({});
    CHECK(parsed.port == 8765);
    CHECK(parsed.bind_host == "0.0.0.0");
    CHECK(parsed.auth_timeout_seconds == 30);
    CHECK_FALSE(parsed.mode.has_value());
    CHECK_FALSE(openlink_relay::cli_utils::has_subcommand(parsed));
  }

  SECTION("listener and access options are read")
  {
    const auto parsed =
      parse({ "-p", "9000", "--bind", "127.0.0.1", "-n", "studio", "--mode", "pin", "--pin", "4321", "--auth-timeout", "10", "-v" });
    CHECK(parsed.port == 9000);
    CHECK(parsed.bind_host == "127.0.0.1");
    CHECK(parsed.host_name == "studio");
    CHECK(parsed.mode == "pin");
    CHECK(parsed.pin == "4321");
    CHECK(parsed.auth_timeout_seconds == 10);
    CHECK(parsed.verbose);
    CHECK(openlink_relay::cli_utils::validate_cli_args(parsed));
  }

  SECTION("version flag is recognised")
  {
    CHECK(parse({ "--version" }).show_version);
  }

  SECTION("an absolute store path is kept as given")
  {
    const auto parsed = parse({ "--store", "/var/lib/openlink/relay.json" });
    CHECK(parsed.store_path == "/var/lib/openlink/relay.json");
  }
}

TEST_CASE("Credential modes need their credential", "[cli_utils][cli_parser]")
{
  CHECK_FALSE(openlink_relay::cli_utils::validate_cli_args(parse({ "--mode", "pin" })));
  CHECK_FALSE(openlink_relay::cli_utils::validate_cli_args(parse({ "--mode", "password" })));
  CHECK(openlink_relay::cli_utils::validate_cli_args(parse({ "--mode", "password", "--password", "hunter22" })));
  CHECK(openlink_relay::cli_utils::validate_cli_args(parse({ "--mode", "whitelist" })));
}

TEST_CASE("Subcommands set their arguments", "[cli_utils][cli_parser]")
{
  SECTION("resolve")
  {
    const auto parsed = parse({ "resolve", "myrelay.eth" });
    CHECK(parsed.resolve_parsed);
    CHECK(parsed.resolve_address == "myrelay.eth");
    CHECK(openlink_relay::cli_utils::has_subcommand(parsed));
  }

  SECTION("check")
  {
    const auto parsed = parse({ "check", "wss://relay.example:8765" });
    CHECK(parsed.check_parsed);
    CHECK(parsed.check_url == "wss://relay.example:8765");
  }

  SECTION("best")
  {
    CHECK(parse({ "best" }).best_parsed);
  }

  SECTION("report with an explicit reporter")
  {
    const auto parsed = parse({ "report", "wss://bad.example", "spam", "--reporter", "machine-7" });
    CHECK(parsed.report_parsed);
    CHECK(parsed.report_url == "wss://bad.example");
    CHECK(parsed.report_reason == "spam");
    CHECK(parsed.reporter_id == "machine-7");
    CHECK(openlink_relay::cli_utils::validate_cli_args(parsed));
  }
}
