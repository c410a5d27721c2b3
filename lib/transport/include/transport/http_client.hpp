#pragma once

#include <concepts/http_client.hpp>
#include <transport/http_types.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <cstdint>
#include <memory>

namespace openlink_relay::transport {

/**
 * @brief HTTP/1.1 client over plain TCP or TLS built on Boost.Beast.
 *
 * One connection per request. The request timeout bounds resolve, connect,
 * handshake, write and read together. The TLS shutdown runs after the response
 * is returned. Certificate and hostname verification are on unless
 * the request clears verify_peer (used by health probes against self-signed relays).
 */
class http_client
{
public:
  /// Largest response body accepted
  static constexpr std::uint64_t max_body_bytes{ 1024ULL * 1024ULL };

  /**
   * @brief Constructs a client bound to an io_context.
   *
   * @param io_context Boost.Asio io_context the requests run on
   */
  explicit http_client(const std::shared_ptr<boost::asio::io_context> &io_context);

  /**
   * @brief Performs a request.
   *
   * @param request Method, URL, headers, body and deadline
   * @return Awaitable yielding the status and body for any HTTP status
   * @throws std::invalid_argument when the URL is not http:// or https://
   * @throws boost::system::system_error on resolve, connect, TLS or I/O failure
   */
  auto request(http_request request) -> boost::asio::awaitable<http_response>;

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<boost::asio::ssl::context> verifying_context_;
  std::shared_ptr<boost::asio::ssl::context> permissive_context_;
};

static_assert(concepts::http_client<http_client>);

}// namespace openlink_relay::transport
