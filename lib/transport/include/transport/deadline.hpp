#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <memory>
#include <string>

namespace openlink_relay::transport {

/**
 * @brief Resolves a host, cancelling the lookup when the deadline passes.
 *
 * A steady_timer armed for the deadline cancels the resolver. The resolver is
 * shared with the timer handler so a late expiry never touches a released one.
 *
 * @tparam Resolver Type with async_resolve(host, service, token), cancel() and results_type
 * @param resolver Resolver to run the lookup on
 * @param host Hostname or IP literal
 * @param port Service or port number
 * @param deadline Point after which the lookup counts as timed out
 * @return Awaitable yielding the resolved endpoints
 * @throws boost::system::system_error with beast::error::timeout when the deadline passes,
 *         or the resolver's own error
 */
template<typename Resolver>
auto resolve_before(std::shared_ptr<Resolver> resolver,
  std::string host,
  std::string port,
  std::chrono::steady_clock::time_point deadline) -> boost::asio::awaitable<typename Resolver::results_type>
{
  auto executor = co_await boost::asio::this_coro::executor;
  boost::asio::steady_timer watchdog(executor, deadline);
  auto finished = std::make_shared<std::atomic<bool>>(false);
  watchdog.async_wait([resolver, finished](const boost::system::error_code &error) {
    if (not error and not finished->load()) { resolver->cancel(); }
  });

  boost::system::error_code error;
  auto results =
    co_await resolver->async_resolve(host, port, boost::asio::redirect_error(boost::asio::use_awaitable, error));
  finished->store(true);
  watchdog.cancel();

  if (error == boost::asio::error::operation_aborted and std::chrono::steady_clock::now() >= deadline) {
    throw boost::system::system_error(boost::beast::error::timeout);
  }
  if (error) { throw boost::system::system_error(error); }
  co_return results;
}

}// namespace openlink_relay::transport
