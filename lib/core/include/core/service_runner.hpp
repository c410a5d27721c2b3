#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <concepts>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace openlink_relay::core {

/**
 * @brief Concept for long-running services driven by a coroutine.
 *
 * Services provide run(slot), which loops until the slot is cancelled.
 */
template<typename T>
concept Service = requires(T svc, std::shared_ptr<boost::asio::cancellation_slot> slot) {
  { svc.run(slot) } -> std::same_as<boost::asio::awaitable<void>>;
};

/**
 * @brief Runs a service coroutine, treating cancellation as a normal exit.
 *
 * @tparam S Service type
 * @param svc The service to run
 * @param cancel_slot Cancellation slot for stopping the service
 * @param service_name Name for logging
 * @return Awaitable that completes when the service exits
 */
template<Service S>
auto run_service(std::shared_ptr<S> svc,
  std::shared_ptr<boost::asio::cancellation_slot> cancel_slot,
  std::string service_name) -> boost::asio::awaitable<void>
{
  spdlog::trace("[{}] Coroutine started", service_name);
  try {
    co_await svc->run(cancel_slot);
  } catch (const boost::system::system_error &err) {
    if (err.code() == boost::asio::error::operation_aborted
        or err.code() == boost::asio::experimental::error::channel_cancelled
        or err.code() == boost::asio::experimental::error::channel_closed) {
      spdlog::debug("[{}] Cancelled, exiting run loop", service_name);
      co_return;
    }
    spdlog::error("[{}] Unexpected error in run loop: {}", service_name, err.what());
  } catch (const std::exception &err) {
    spdlog::error("[{}] Unknown exception in run loop: {}", service_name, err.what());
  }
  spdlog::trace("[{}] Coroutine exiting", service_name);
}

/**
 * @brief Handle to a spawned service: lifecycle flags plus its stop signal.
 */
class service_handle
{
public:
  explicit service_handle(std::shared_ptr<boost::asio::io_context> io_context)
    : io_context_(std::move(io_context)), signal_(std::make_shared<boost::asio::cancellation_signal>()),
      slot_(std::make_shared<boost::asio::cancellation_slot>(signal_->slot()))
  {}

  [[nodiscard]] auto slot() const -> std::shared_ptr<boost::asio::cancellation_slot> { return slot_; }

  /// Requests cancellation; the emit runs on the io_context so it is safe from any thread.
  auto stop() -> void
  {
    boost::asio::post(*io_context_, [signal = signal_]() { signal->emit(boost::asio::cancellation_type::all); });
  }

  [[nodiscard]] auto started() const -> bool { return started_.load(); }
  [[nodiscard]] auto done() const -> bool { return done_.load(); }

  auto mark_started() -> void { started_ = true; }
  auto mark_done() -> void { done_ = true; }

private:
  std::atomic<bool> started_{ false };
  std::atomic<bool> done_{ false };
  std::shared_ptr<boost::asio::io_context> io_context_;
  std::shared_ptr<boost::asio::cancellation_signal> signal_;
  std::shared_ptr<boost::asio::cancellation_slot> slot_;
};

/**
 * @brief Spawns a service as a detached coroutine.
 *
 * @tparam S Service type
 * @param io_ctx Boost.Asio io_context to spawn on
 * @param svc The service to spawn
 * @param service_name Name for logging
 * @return Handle used to observe and stop the service
 */
template<Service S>
auto spawn_service(const std::shared_ptr<boost::asio::io_context> &io_ctx,
  std::shared_ptr<S> svc,
  std::string_view service_name) -> std::shared_ptr<service_handle>
{
  auto handle = std::make_shared<service_handle>(io_ctx);
  boost::asio::co_spawn(
    *io_ctx,
    [](std::shared_ptr<S> service,
      std::shared_ptr<service_handle> svc_handle,
      std::string name) -> boost::asio::awaitable<void> {
      svc_handle->mark_started();
      co_await run_service(service, svc_handle->slot(), name);
      svc_handle->mark_done();
    }(svc, handle, std::string(service_name)),
    boost::asio::detached);
  return handle;
}

}// namespace openlink_relay::core
