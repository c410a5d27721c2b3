#pragma once

#include <cli_utils/cli_parser.hpp>
#include <store/json_file_store.hpp>
#include <transport/http_client.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>

namespace openlink_relay::app {

/// Collaborators shared by the one-shot subcommands
struct command_context
{
  std::shared_ptr<boost::asio::io_context> io_context;
  std::shared_ptr<transport::http_client> client;
  std::shared_ptr<store::json_file_store> store;
};

/**
 * @brief Runs the subcommand selected on the command line.
 *
 * @return Awaitable yielding the process exit code
 */
auto run_command(const cli_utils::cli_args &args, command_context context) -> boost::asio::awaitable<int>;

}// namespace openlink_relay::app
