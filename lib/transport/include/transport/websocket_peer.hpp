#pragma once

#include <concepts/relay_peer.hpp>

#include <atomic>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace openlink_relay::transport {

/**
 * @brief Accepted WebSocket connection with a serialized outbound frame queue.
 *
 * The stream's executor is a strand; every write and the close handshake run
 * on it, so send_text()/send_binary() may be called from any thread. Reads are
 * driven by the listener on the same strand.
 */
class websocket_peer : public std::enable_shared_from_this<websocket_peer>
{
public:
  using stream_t = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  /// Frames queued beyond this are dropped
  static constexpr std::size_t max_queued_frames{ 1024 };

  explicit websocket_peer(stream_t stream);

  websocket_peer(const websocket_peer &) = delete;
  auto operator=(const websocket_peer &) -> websocket_peer & = delete;
  websocket_peer(websocket_peer &&) = delete;
  auto operator=(websocket_peer &&) -> websocket_peer & = delete;
  ~websocket_peer() = default;

  auto send_text(std::string text) -> void;

  auto send_binary(std::vector<std::byte> bytes) -> void;

  /**
   * @brief Sends a normal close frame once queued frames are flushed.
   */
  auto close() -> void;

  [[nodiscard]] auto is_open() const -> bool;

  /// Marks the peer closed after the read side failed.
  auto mark_closed() -> void;

  [[nodiscard]] auto stream() -> stream_t & { return ws_; }

private:
  using frame_t = std::variant<std::string, std::vector<std::byte>>;

  auto enqueue(frame_t frame) -> void;
  auto write_next() -> void;
  auto close_now() -> void;

  stream_t ws_;
  std::deque<frame_t> outbox_;
  bool writing_{ false };
  bool close_requested_{ false };
  std::atomic<bool> open_{ true };
};

static_assert(concepts::relay_peer<websocket_peer>);

}// namespace openlink_relay::transport
