#include "commands.hpp"
#include "event_logger.hpp"

#include <access/access_config.hpp>
#include <cli_utils/app_init.hpp>
#include <cli_utils/cli_parser.hpp>
#include <core/service_runner.hpp>
#include <relay/relay_host.hpp>
#include <relay/relay_options.hpp>
#include <store/json_file_store.hpp>
#include <transport/http_client.hpp>
#include <trust/host_trust_manager.hpp>

#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <exception>
#include <fmt/core.h>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace {

using host_t = openlink_relay::relay::relay_host<openlink_relay::store::json_file_store>;

constexpr unsigned max_io_threads = 4;

auto apply_access_args(const openlink_relay::cli_utils::cli_args &args, host_t &host) -> bool
{
  if (args.host_name) { host.set_host_name(*args.host_name); }

  if (args.pin) {
    if (auto result = host.set_pin_code(*args.pin); not result.success) {
      spdlog::error("{}", result.error.value_or("Invalid PIN"));
      return false;
    }
  }
  if (args.password) {
    if (auto result = host.set_password(*args.password); not result.success) {
      spdlog::error("{}", result.error.value_or("Invalid password"));
      return false;
    }
  }

  if (not args.mode) { return true; }
  const auto mode = openlink_relay::access::parse_access_mode(*args.mode);
  if (not mode) {
    spdlog::error("Invalid mode: {}", *args.mode);
    return false;
  }

  switch (*mode) {
  case openlink_relay::access::access_mode::public_access:
    host.set_public();
    break;
  case openlink_relay::access::access_mode::whitelist:
    host.set_whitelist_mode();
    break;
  case openlink_relay::access::access_mode::two_factor:
    if (not host.get_config().two_factor_enabled) {
      const auto setup = host.enable_2fa();
      fmt::print("Scan with an authenticator app: {}\n", setup.otpauth_url);
    }
    break;
  case openlink_relay::access::access_mode::pin:
  case openlink_relay::access::access_mode::password:
    // --pin / --password already switched the mode
    break;
  }
  return true;
}

auto run_io_threads(const std::shared_ptr<boost::asio::io_context> &io_context) -> void
{
  const auto count = std::clamp(std::thread::hardware_concurrency(), 1U, max_io_threads);
  std::vector<std::thread> workers;
  workers.reserve(count - 1);
  for (unsigned i = 1; i < count; ++i) {
    workers.emplace_back([io_context]() { io_context->run(); });
  }
  io_context->run();
  for (auto &worker : workers) { worker.join(); }
}

}// namespace

// NOLINTNEXTLINE(bugprone-exception-escape)
auto main(int argc, char **argv) -> int
{
  auto args = openlink_relay::cli_utils::parse_cli_args(argc, argv);

  if (not openlink_relay::cli_utils::validate_cli_args(args)) { return 1; }

  openlink_relay::cli_utils::configure_logging(args);

  if (args.show_version) {
    openlink_relay::cli_utils::print_version();
    return 0;
  }

  auto io_context = std::make_shared<boost::asio::io_context>();
  auto client = std::make_shared<openlink_relay::transport::http_client>(io_context);
  auto store = std::make_shared<openlink_relay::store::json_file_store>(args.store_path);

  if (openlink_relay::cli_utils::has_subcommand(args)) {
    int exit_code = 1;
    boost::asio::co_spawn(*io_context,
      openlink_relay::app::run_command(
        args, openlink_relay::app::command_context{ .io_context = io_context, .client = client, .store = store }),
      [&exit_code](const std::exception_ptr &error, int code) {
        if (not error) {
          exit_code = code;
          return;
        }
        try {
          std::rethrow_exception(error);
        } catch (const std::exception &e) {
          spdlog::error("Command failed: {}", e.what());
        }
      });
    io_context->run();
    return exit_code;
  }

  openlink_relay::relay::relay_options options;
  options.port = args.port;
  options.bind_host = args.bind_host;
  options.auth_timeout = std::chrono::seconds(args.auth_timeout_seconds);

  host_t host(io_context, store, options);
  if (not apply_access_args(args, host)) { return 1; }

  auto logger = std::make_shared<openlink_relay::app::event_logger>(host.events());
  auto logger_handle = openlink_relay::core::spawn_service(io_context, logger, "event_logger");

  std::uint16_t bound_port = 0;
  try {
    bound_port = host.start();
  } catch (const std::exception &e) {
    spdlog::error("Cannot start relay: {}", e.what());
    return 1;
  }

  const auto config = host.get_config();
  openlink_relay::cli_utils::print_app_banner({ .bind_host = config.bind_host,
    .port = bound_port,
    .access_mode = std::string(openlink_relay::access::to_string(config.mode)),
    .store_path = args.store_path });

  if (args.advertise_url and config.is_public) {
    auto registry = std::make_shared<openlink_relay::trust::host_trust_manager<openlink_relay::transport::http_client>>(client);
    openlink_relay::trust::host_registration registration{ .name = config.host_name.value_or("OpenLink Relay"),
      .url = *args.advertise_url,
      .region = {},
      .features = { "signaling", "relay", "turn" },
      .public_key = std::nullopt };
    boost::asio::co_spawn(
      *io_context,
      [](auto trust_registry, openlink_relay::trust::host_registration host_info) -> boost::asio::awaitable<void> {
        const auto result = co_await trust_registry->register_public_host(std::move(host_info));
        if (not result.success) { spdlog::warn("Registration failed: {}", result.error.value_or("unknown error")); }
      }(registry, std::move(registration)),
      boost::asio::detached);
  }

  boost::asio::signal_set signals(*io_context, SIGINT, SIGTERM);
  signals.async_wait([&host, logger_handle](const boost::system::error_code &error, int signal_number) {
    if (error) { return; }
    spdlog::info("Received signal {}, shutting down", signal_number);
    host.stop();
    logger_handle->stop();
  });

  run_io_threads(io_context);

  return 0;
}
