#pragma once

#include <concepts/connection_handler.hpp>
#include <transport/websocket_peer.hpp>

#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace openlink_relay::transport {

/**
 * @brief Accepts TCP connections and splits them into WebSocket and plain HTTP traffic.
 *
 * WebSocket upgrades are handed to the handler as websocket_peer objects and read
 * until the socket closes. Plain GET requests are answered from handler.http_get()
 * with a JSON body, or 404.
 *
 * @tparam Handler Type satisfying concepts::connection_handler for websocket_peer
 */
template<typename Handler>
  requires concepts::connection_handler<Handler, websocket_peer>
class listener : public std::enable_shared_from_this<listener<Handler>>
{
public:
  /// Deadline for reading the initial HTTP request
  static constexpr std::chrono::seconds request_timeout{ 30 };

  /// Largest inbound WebSocket message
  static constexpr std::size_t max_message_bytes{ 16ULL * 1024ULL * 1024ULL };

  /**
   * @brief Constructs a listener.
   *
   * @param io_context io_context accepted sockets run on
   * @param handler Consumer of connections and HTTP requests
   */
  listener(const std::shared_ptr<boost::asio::io_context> &io_context, std::shared_ptr<Handler> handler)
    : io_context_(io_context), handler_(std::move(handler)), acceptor_(boost::asio::make_strand(*io_context_))
  {}

  /**
   * @brief Binds, listens and starts the accept loop.
   *
   * @param bind_host Local address to bind
   * @param port Local port, 0 for an ephemeral port
   * @return The bound port
   * @throws boost::system::system_error if the address is invalid or bind fails
   */
  auto start(const std::string &bind_host, std::uint16_t port) -> std::uint16_t
  {
    const boost::asio::ip::tcp::endpoint endpoint{ boost::asio::ip::make_address(bind_host), port };
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    running_ = true;

    const auto bound_port = acceptor_.local_endpoint().port();
    spdlog::info("[listener] Listening on {}:{}", bind_host, bound_port);

    boost::asio::co_spawn(acceptor_.get_executor(), accept_loop(this->shared_from_this()), boost::asio::detached);
    return bound_port;
  }

  /**
   * @brief Stops accepting. Established connections are closed by the handler.
   */
  auto stop() -> void
  {
    if (not running_.exchange(false)) { return; }
    boost::asio::post(acceptor_.get_executor(), [self = this->shared_from_this()] {
      boost::system::error_code error;
      self->acceptor_.close(error);
      if (error) { spdlog::debug("[listener] Acceptor close reported: {}", error.message()); }
    });
  }

  [[nodiscard]] auto is_running() const -> bool { return running_.load(); }

private:
  static auto accept_loop(std::shared_ptr<listener> self) -> boost::asio::awaitable<void>
  {
    while (self->running_) {
      boost::system::error_code error;
      auto socket = co_await self->acceptor_.async_accept(
        boost::asio::make_strand(*self->io_context_), boost::asio::redirect_error(boost::asio::use_awaitable, error));
      if (error) {
        if (error == boost::asio::error::operation_aborted or not self->running_) {
          spdlog::debug("[listener] Accept loop stopped");
          co_return;
        }
        spdlog::warn("[listener] Accept failed: {}", error.message());
        continue;
      }
      auto executor = socket.get_executor();
      boost::asio::co_spawn(executor, serve(self, std::move(socket)), [](const std::exception_ptr &failure) {
        if (not failure) { return; }
        try {
          std::rethrow_exception(failure);
        } catch (const boost::system::system_error &err) {
          spdlog::debug("[listener] Connection ended: {}", err.what());
        } catch (const std::exception &err) {
          spdlog::error("[listener] Connection handler failed: {}", err.what());
        }
      });
    }
  }

  static auto serve(std::shared_ptr<listener> self, boost::asio::ip::tcp::socket socket)
    -> boost::asio::awaitable<void>
  {
    namespace beast = boost::beast;
    namespace http = boost::beast::http;

    boost::system::error_code endpoint_error;
    const auto remote = socket.remote_endpoint(endpoint_error);
    const auto remote_ip = endpoint_error ? std::string("unknown") : remote.address().to_string();

    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> request;

    stream.expires_after(request_timeout);
    co_await http::async_read(stream, buffer, request, boost::asio::use_awaitable);

    if (beast::websocket::is_upgrade(request)) {
      stream.expires_never();
      beast::websocket::stream<beast::tcp_stream> ws(std::move(stream));
      ws.set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::server));
      ws.set_option(beast::websocket::stream_base::decorator([](beast::websocket::response_type &response) {
        response.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " openlink-relay");
      }));
      ws.read_message_max(max_message_bytes);
      co_await ws.async_accept(request, boost::asio::use_awaitable);

      auto peer = std::make_shared<websocket_peer>(std::move(ws));
      co_await read_loop(self, std::move(peer), remote_ip);
      co_return;
    }

    auto response = self->respond(request);
    co_await http::async_write(stream, response, boost::asio::use_awaitable);

    boost::system::error_code shutdown_error;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, shutdown_error);
    if (shutdown_error) { spdlog::trace("[listener] Shutdown reported: {}", shutdown_error.message()); }
  }

  static auto read_loop(std::shared_ptr<listener> self, std::shared_ptr<websocket_peer> peer, std::string remote_ip)
    -> boost::asio::awaitable<void>
  {
    auto connection_id = self->handler_->on_open(peer, remote_ip);
    if (not connection_id) { co_return; }

    boost::beast::flat_buffer buffer;
    while (true) {
      boost::system::error_code error;
      co_await peer->stream().async_read(buffer, boost::asio::redirect_error(boost::asio::use_awaitable, error));
      if (error) {
        spdlog::debug("[listener] Connection {} read ended: {}", *connection_id, error.message());
        break;
      }

      const auto data = buffer.cdata();
      if (peer->stream().got_text()) {
        self->handler_->on_text(*connection_id, boost::beast::buffers_to_string(data));
      } else {
        const auto *first = static_cast<const std::byte *>(data.data());
        self->handler_->on_binary(*connection_id, std::vector<std::byte>(first, first + data.size()));
      }
      buffer.consume(buffer.size());
    }

    peer->mark_closed();
    self->handler_->on_close(*connection_id);
  }

  template<typename Request> auto respond(const Request &request) -> boost::beast::http::response<boost::beast::http::string_body>
  {
    namespace http = boost::beast::http;

    std::optional<std::string> body;
    if (request.method() == http::verb::get) { body = handler_->http_get(std::string(request.target())); }

    http::response<http::string_body> response{ body ? http::status::ok : http::status::not_found,
      request.version() };
    response.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " openlink-relay");
    response.set(http::field::content_type, "application/json");
    response.set(http::field::access_control_allow_origin, "*");
    response.keep_alive(false);
    response.body() = body ? std::move(*body) : std::string(R"({"error":"Not found"})");
    response.prepare_payload();
    return response;
  }

  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<Handler> handler_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> running_{ false };
};

}// namespace openlink_relay::transport
