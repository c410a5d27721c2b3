#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <async/async_queue.hpp>
#include <core/events.hpp>

namespace {

using openlink_relay::core::events::relay_event_t;
using event_queue_t = openlink_relay::async::async_queue<relay_event_t>;

}// namespace

SCENARIO("Relay events are buffered until consumed", "[async_queue][push]")
{
  GIVEN("An empty event queue")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    event_queue_t queue(io_context);

    THEN("it reports empty") { REQUIRE(queue.empty()); }

    WHEN("a relay publishes lifecycle events")
    {
      constexpr std::uint16_t relay_port = 8765;
      REQUIRE(queue.push(openlink_relay::core::events::relay::started{ .bind_host = "0.0.0.0", .port = relay_port }));
      REQUIRE(queue.push(openlink_relay::core::events::relay::connection_opened{
        .connection_id = "c_1", .remote_ip = "198.51.100.1", .authenticated = true }));

      THEN("they come out in order")
      {
        REQUIRE(queue.size() == 2);
        const auto first = queue.try_pop();
        REQUIRE(first.has_value());
        const auto *started = std::get_if<openlink_relay::core::events::relay::started>(&*first);
        REQUIRE(started != nullptr);
        CHECK(started->port == relay_port);
        CHECK(std::holds_alternative<openlink_relay::core::events::relay::connection_opened>(*queue.try_pop()));
        CHECK(queue.empty());
        CHECK_FALSE(queue.try_pop().has_value());
      }
    }
  }

  GIVEN("A queue with room for two events")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    event_queue_t queue(io_context, 2);

    WHEN("a third event is pushed")
    {
      REQUIRE(queue.push(openlink_relay::core::events::relay::stopped{}));
      REQUIRE(queue.push(openlink_relay::core::events::relay::stopped{}));
      const bool accepted = queue.push(openlink_relay::core::events::relay::stopped{});

      THEN("it is dropped rather than blocking the publisher")
      {
        CHECK_FALSE(accepted);
        CHECK(queue.size() == 2);
      }
    }
  }
}

SCENARIO("A consumer coroutine waits for events", "[async_queue][pop]")
{
  GIVEN("A consumer suspended on an empty queue")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    event_queue_t queue(io_context);
    auto received = std::make_shared<std::string>();

    boost::asio::co_spawn(
      *io_context,
      [](std::reference_wrapper<event_queue_t> queue_ref, std::shared_ptr<std::string> out) -> boost::asio::awaitable<void> {
        const auto event = co_await queue_ref.get().pop();
        if (const auto *closed = std::get_if<openlink_relay::core::events::relay::session_closed>(&event)) {
          *out = closed->session_id;
        }
      }(std::ref(queue), received),
      boost::asio::detached);

    io_context->poll();
    REQUIRE(received->empty());

    WHEN("an event is pushed")
    {
      queue.push(openlink_relay::core::events::relay::session_closed{ .session_id = "room-1" });
      io_context->run();

      THEN("the consumer resumes with it") { CHECK(*received == "room-1"); }
    }
  }

  GIVEN("A consumer waiting when the queue is closed")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    event_queue_t queue(io_context);
    auto failed = std::make_shared<bool>(false);

    boost::asio::co_spawn(
      *io_context,
      [](std::reference_wrapper<event_queue_t> queue_ref, std::shared_ptr<bool> failed_ptr) -> boost::asio::awaitable<void> {
        try {
          (void)co_await queue_ref.get().pop();
        } catch (const boost::system::system_error &) {
          *failed_ptr = true;
        }
      }(std::ref(queue), failed),
      boost::asio::detached);

    io_context->poll();
    queue.close();
    io_context->run();

    THEN("the pop fails instead of hanging") { CHECK(*failed); }
  }
}

SCENARIO("Connections on many threads publish into one queue", "[async_queue][concurrent]")
{
  GIVEN("Several producer threads")
  {
    auto io_context = std::make_shared<boost::asio::io_context>();
    event_queue_t queue(io_context);

    constexpr int producers = 4;
    constexpr int events_per_producer = 100;
    constexpr int total_events = producers * events_per_producer;

    auto received = std::make_shared<int>(0);
    boost::asio::co_spawn(
      *io_context,
      [](std::reference_wrapper<event_queue_t> queue_ref, std::shared_ptr<int> count, int total) -> boost::asio::awaitable<void> {
        for (int idx = 0; idx < total; ++idx) {
          (void)co_await queue_ref.get().pop();
          ++(*count);
        }
      }(std::ref(queue), received, total_events),
      boost::asio::detached);

    std::vector<std::thread> threads;
    threads.reserve(producers);
    for (int producer = 0; producer < producers; ++producer) {
      threads.emplace_back([&queue, producer]() {
        for (int idx = 0; idx < events_per_producer; ++idx) {
          queue.push(openlink_relay::core::events::relay::connection_closed{
            .connection_id = "c_" + std::to_string(producer) + "_" + std::to_string(idx) });
        }
      });
    }
    for (auto &thread : threads) { thread.join(); }

    io_context->run();

    THEN("every event is delivered once")
    {
      CHECK(*received == total_events);
      CHECK(queue.empty());
    }
  }
}
