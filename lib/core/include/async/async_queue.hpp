#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace openlink_relay::async {

/**
 * @brief Thread-safe asynchronous queue used as an outbound event channel.
 *
 * @tparam T The type of elements stored in the queue
 *
 * Producers (relay engine, server directory) push typed events without blocking;
 * the application shell consumes them from a coroutine. Events pushed while the
 * channel is full are dropped, since they describe live state that a later event
 * supersedes.
 */
template<typename T> class async_queue
{
public:
  /// Default number of elements the queue can hold
  static constexpr std::size_t default_capacity{ 1024 };

  /**
   * @brief Constructs a new async queue.
   *
   * @param io_context Shared pointer to the Boost.Asio io_context for async operations
   * @param capacity Maximum number of buffered elements
   */
  explicit async_queue(const std::shared_ptr<boost::asio::io_context> &io_context,
    std::size_t capacity = default_capacity)
    : io_context_(io_context), channel_(*io_context_, capacity), size_(0)
  {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Pushes a value onto the queue (non-blocking).
   *
   * @param value The value to push (moved into the queue)
   * @return true if the value was buffered, false if it was dropped
   */
  auto push(T value) -> bool
  {
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) {
      spdlog::warn("[async_queue] Channel full or closed, dropping event");
      return false;
    }
    ++size_;
    return true;
  }

  /**
   * @brief Asynchronously pops a value from the queue (coroutine).
   *
   * @param cancel_slot Optional cancellation slot for operation cancellation
   * @return Awaitable that yields the next value from the queue
   * @throws boost::system::system_error on cancellation or channel errors
   */
  auto pop(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot = nullptr) -> boost::asio::awaitable<T>
  {
    boost::system::error_code err;

    if (cancel_slot) {
      auto val = co_await channel_.async_receive(boost::asio::bind_cancellation_slot(
        *cancel_slot, boost::asio::redirect_error(boost::asio::use_awaitable, err)));
      if (err) { throw boost::system::system_error(err); }
      --size_;
      co_return val;
    }

    auto val = co_await channel_.async_receive(boost::asio::redirect_error(boost::asio::use_awaitable, err));
    if (err) { throw boost::system::system_error(err); }
    --size_;
    co_return val;
  }

  /**
   * @brief Attempts to pop a value without blocking.
   *
   * @return The value if available, std::nullopt if the queue is empty
   */
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    channel_.try_receive([&value](boost::system::error_code /*ec*/, T rx_value) { value = std::move(rx_value); });

    if (value.has_value()) { --size_; }
    return value;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  /**
   * @brief Closes the queue; pending and future pops fail with channel_closed.
   */
  auto close() -> void { channel_.close(); }

private:
  std::shared_ptr<boost::asio::io_context> io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::atomic<std::size_t> size_;
};

}// namespace openlink_relay::async
