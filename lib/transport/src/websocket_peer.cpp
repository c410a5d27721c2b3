#include <transport/websocket_peer.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

namespace openlink_relay::transport {

websocket_peer::websocket_peer(stream_t stream) : ws_(std::move(stream)) {}

auto websocket_peer::send_text(std::string text) -> void { enqueue(std::move(text)); }

auto websocket_peer::send_binary(std::vector<std::byte> bytes) -> void { enqueue(std::move(bytes)); }

auto websocket_peer::is_open() const -> bool { return open_.load(); }

auto websocket_peer::mark_closed() -> void { open_.store(false); }

auto websocket_peer::close() -> void
{
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()] {
    if (self->close_requested_) { return; }
    self->close_requested_ = true;
    if (not self->writing_) { self->close_now(); }
  });
}

auto websocket_peer::enqueue(frame_t frame) -> void
{
  if (not open_.load()) { return; }

  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    if (self->close_requested_ or not self->open_.load()) { return; }
    if (self->outbox_.size() >= max_queued_frames) {
      spdlog::warn("[websocket_peer] Outbound queue full, dropping frame");
      return;
    }
    self->outbox_.push_back(std::move(frame));
    if (not self->writing_) { self->write_next(); }
  });
}

auto websocket_peer::write_next() -> void
{
  if (outbox_.empty()) {
    writing_ = false;
    if (close_requested_) { close_now(); }
    return;
  }

  writing_ = true;
  const auto &frame = outbox_.front();
  const bool binary = std::holds_alternative<std::vector<std::byte>>(frame);
  ws_.binary(binary);
  const auto buffer = binary ? boost::asio::buffer(std::get<std::vector<std::byte>>(frame))
                             : boost::asio::buffer(std::get<std::string>(frame));

  ws_.async_write(buffer, [self = shared_from_this()](const boost::system::error_code &error, std::size_t /*bytes*/) {
    self->outbox_.pop_front();
    if (error) {
      spdlog::debug("[websocket_peer] Write failed: {}", error.message());
      self->open_.store(false);
      self->outbox_.clear();
      self->writing_ = false;
      return;
    }
    self->write_next();
  });
}

auto websocket_peer::close_now() -> void
{
  if (not open_.exchange(false)) { return; }
  ws_.async_close(boost::beast::websocket::close_code::normal, [self = shared_from_this()](const boost::system::error_code &error) {
    if (error) { spdlog::debug("[websocket_peer] Close handshake failed: {}", error.message()); }
  });
}

}// namespace openlink_relay::transport
