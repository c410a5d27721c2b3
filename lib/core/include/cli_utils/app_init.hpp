#pragma once

#include <cli_utils/cli_parser.hpp>
#include <internal_use_only/config.hpp>

#include <cstdint>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <string>

namespace openlink_relay::cli_utils {

struct app_state
{
  std::string bind_host;
  std::uint16_t port{};
  std::string access_mode;
  std::string store_path;
};

inline auto configure_logging(const cli_args &args) -> void
{
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  if (args.verbose) { spdlog::set_level(spdlog::level::debug); }
}

inline auto print_version() -> void
{
  fmt::print("{} v{} ({})\n", openlink_relay::cmake::project_name, openlink_relay::cmake::project_version,
    openlink_relay::cmake::git_sha);
}

inline auto print_app_banner(const app_state &state) -> void
{
  fmt::print("OpenLink Relay v{}\n", openlink_relay::cmake::project_version);
  fmt::print("Listening: ws://{}:{}\n", state.bind_host, state.port);
  fmt::print("Access: {}\n", state.access_mode);
  fmt::print("State: {}\n\n", state.store_path);
}

}// namespace openlink_relay::cli_utils
