#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/system_error.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>

#include <transport/deadline.hpp>

#include "test_doubles/test_double_resolver.hpp"

using openlink_relay::test::test_double_resolver;

SCENARIO("Name resolution is bounded by the request deadline", "[transport][deadline]")
{
  GIVEN("A resolver that never answers")
  {
    boost::asio::io_context io_context;
    auto resolver = std::make_shared<test_double_resolver>(io_context.get_executor(), test_double_resolver::stalled);

    WHEN("a lookup is started with a 20ms deadline")
    {
      const auto started = std::chrono::steady_clock::now();
      auto result = boost::asio::co_spawn(io_context,
        openlink_relay::transport::resolve_before(
          resolver, "slow.example", "443", started + std::chrono::milliseconds(20)),
        boost::asio::use_future);
      io_context.run();

      THEN("the lookup is cancelled and reported as a timeout")
      {
        CHECK(resolver->cancels() == 1);
        try {
          (void)result.get();
          FAIL("expected a timeout");
        } catch (const boost::system::system_error &err) {
          CHECK(err.code() == boost::beast::error::timeout);
        }
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));
      }
    }
  }

  GIVEN("A resolver that answers within the deadline")
  {
    boost::asio::io_context io_context;
    auto resolver = std::make_shared<test_double_resolver>(io_context.get_executor(), std::chrono::milliseconds(1));

    WHEN("a lookup is started with a generous deadline")
    {
      auto result = boost::asio::co_spawn(io_context,
        openlink_relay::transport::resolve_before(
          resolver, "fast.example", "443", std::chrono::steady_clock::now() + std::chrono::seconds(5)),
        boost::asio::use_future);
      io_context.run();

      THEN("the endpoints are returned and the resolver is left alone")
      {
        CHECK_NOTHROW((void)result.get());
        CHECK(resolver->lookups() == 1);
        CHECK(resolver->cancels() == 0);
      }
    }
  }
}
