#pragma once

#include <transport/http_types.hpp>

#include <boost/asio/awaitable.hpp>
#include <concepts>

namespace openlink_relay::concepts {

/**
 * @brief Concept for asynchronous HTTP clients.
 *
 * request() yields the response for any status code. Transport failures are
 * reported by throwing boost::system::system_error; a missed deadline uses
 * boost::beast::error::timeout. Malformed URLs throw std::invalid_argument.
 */
template<typename T>
concept http_client = requires(T &client, transport::http_request request) {
  { client.request(request) } -> std::same_as<boost::asio::awaitable<transport::http_response>>;
};

}// namespace openlink_relay::concepts
