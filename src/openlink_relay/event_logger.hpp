#pragma once

#include <async/async_queue.hpp>
#include <core/events.hpp>
#include <core/overload.hpp>
#include <core/service_runner.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <memory>
#include <spdlog/spdlog.h>
#include <variant>

namespace openlink_relay::app {

/**
 * @brief Drains the relay event channel into the log.
 */
class event_logger
{
public:
  using queue_t = async::async_queue<core::events::relay_event_t>;

  explicit event_logger(std::shared_ptr<queue_t> events) : events_(std::move(events)) {}

  auto run(std::shared_ptr<boost::asio::cancellation_slot> cancel_slot) -> boost::asio::awaitable<void>
  {
    while (true) {
      auto event = co_await events_->pop(cancel_slot);
      log(event);
    }
  }

private:
  static auto log(const core::events::relay_event_t &event) -> void
  {
    namespace relay = core::events::relay;
    std::visit(core::overload{ [](const relay::started &evt) { spdlog::debug("[events] started {}:{}", evt.bind_host, evt.port); },
                 [](const relay::stopped &) { spdlog::debug("[events] stopped"); },
                 [](const relay::connection_opened &evt) {
                   spdlog::debug("[events] {} opened from {}", evt.connection_id, evt.remote_ip);
                 },
                 [](const relay::connection_closed &evt) { spdlog::debug("[events] {} closed", evt.connection_id); },
                 [](const relay::authenticated &evt) { spdlog::debug("[events] {} authenticated", evt.connection_id); },
                 [](const relay::auth_failed &evt) {
                   spdlog::debug("[events] {} failed auth: {}", evt.connection_id, evt.reason);
                 },
                 [](const relay::auth_timed_out &evt) { spdlog::debug("[events] {} auth timeout", evt.connection_id); },
                 [](const relay::connection_pin_rotated &evt) {
                   spdlog::info("[events] One-time connection PIN rotated, new PIN: {}", evt.pin);
                 },
                 [](const relay::session_created &evt) {
                   spdlog::debug("[events] session {} hosted by {}", evt.session_id, evt.host_id);
                 },
                 [](const relay::session_joined &evt) {
                   spdlog::debug("[events] {} joined {}", evt.connection_id, evt.session_id);
                 },
                 [](const relay::session_left &evt) {
                   spdlog::debug("[events] {} left {}", evt.connection_id, evt.session_id);
                 },
                 [](const relay::session_closed &evt) { spdlog::debug("[events] session {} closed", evt.session_id); },
                 [](const relay::protocol_error &evt) {
                   spdlog::debug("[events] protocol error on {}: {}", evt.connection_id, evt.detail);
                 } },
      event);
  }

  std::shared_ptr<queue_t> events_;
};

static_assert(core::Service<event_logger>);

}// namespace openlink_relay::app
