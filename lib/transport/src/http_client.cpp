#include <transport/deadline.hpp>
#include <transport/http_client.hpp>
#include <transport/url.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace openlink_relay::transport {

namespace {

  namespace beast = boost::beast;
  namespace http = boost::beast::http;
  using boost::asio::use_awaitable;

  template<typename Stream>
  auto exchange(Stream &stream, http::request<http::string_body> &message) -> boost::asio::awaitable<http_response>
  {
    co_await http::async_write(stream, message, use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(http_client::max_body_bytes);
    co_await http::async_read(stream, buffer, parser, use_awaitable);

    auto response = parser.release();
    co_return http_response{ .status = response.result_int(), .body = std::move(response.body()) };
  }

  auto build_message(const http_request &request, const url_parts &parts) -> http::request<http::string_body>
  {
    static constexpr int http_version = 11;

    const auto verb = request.method == http_method::post ? http::verb::post : http::verb::get;
    http::request<http::string_body> message{ verb, parts.target, http_version };
    message.set(http::field::host, format_authority(parts));
    message.set(http::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " openlink-relay");
    for (const auto &[name, value] : request.headers) { message.set(name, value); }
    if (request.method == http_method::post) {
      message.body() = request.body;
      message.prepare_payload();
    }
    return message;
  }

}// namespace

http_client::http_client(const std::shared_ptr<boost::asio::io_context> &io_context)
  : io_context_(io_context),
    verifying_context_(std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client)),
    permissive_context_(std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client))
{
  verifying_context_->set_default_verify_paths();
  verifying_context_->set_verify_mode(boost::asio::ssl::verify_peer);
  permissive_context_->set_verify_mode(boost::asio::ssl::verify_none);
}

auto http_client::request(http_request request) -> boost::asio::awaitable<http_response>
{
  auto parts = parse_url(request.url);
  if (not parts or (parts->scheme != "http" and parts->scheme != "https")) {
    throw std::invalid_argument(fmt::format("unsupported URL: {}", request.url));
  }

  const auto deadline = std::chrono::steady_clock::now() + request.timeout;
  auto executor = co_await boost::asio::this_coro::executor;
  const auto endpoints = co_await resolve_before(
    std::make_shared<boost::asio::ip::tcp::resolver>(executor), parts->host, parts->port, deadline);

  auto message = build_message(request, *parts);
  spdlog::trace("[http_client] {} {}", http::to_string(message.method()), request.url);

  if (parts->scheme == "http") {
    beast::tcp_stream stream(executor);
    stream.expires_at(deadline);
    co_await stream.async_connect(endpoints, use_awaitable);
    auto response = co_await exchange(stream, message);

    boost::system::error_code shutdown_error;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, shutdown_error);
    if (shutdown_error and shutdown_error != beast::errc::not_connected) {
      spdlog::trace("[http_client] Shutdown of {} reported: {}", parts->host, shutdown_error.message());
    }
    co_return response;
  }

  auto context = request.verify_peer ? verifying_context_ : permissive_context_;
  auto tls = std::make_shared<beast::ssl_stream<beast::tcp_stream>>(executor, *context);
  auto &stream = *tls;

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-cstyle-cast,hicpp-no-array-decay)
  if (not SSL_set_tlsext_host_name(stream.native_handle(), parts->host.c_str())) {
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
    throw boost::system::system_error(boost::asio::error::operation_not_supported);
  }
  if (request.verify_peer) { stream.set_verify_callback(boost::asio::ssl::host_name_verification(parts->host)); }

  beast::get_lowest_layer(stream).expires_at(deadline);
  co_await beast::get_lowest_layer(stream).async_connect(endpoints, use_awaitable);
  co_await stream.async_handshake(boost::asio::ssl::stream_base::client, use_awaitable);
  auto response = co_await exchange(stream, message);

  // The close_notify exchange runs after the caller has its response, still bounded by the deadline
  boost::asio::co_spawn(
    executor,
    [tls = std::move(tls), context = std::move(context), host = parts->host]() -> boost::asio::awaitable<void> {
      boost::system::error_code shutdown_error;
      co_await tls->async_shutdown(boost::asio::redirect_error(use_awaitable, shutdown_error));
      if (shutdown_error and shutdown_error != boost::asio::ssl::error::stream_truncated) {
        spdlog::trace("[http_client] TLS shutdown of {} reported: {}", host, shutdown_error.message());
      }
    },
    boost::asio::detached);
  co_return response;
}

}// namespace openlink_relay::transport
