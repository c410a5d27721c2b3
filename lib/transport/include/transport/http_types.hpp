#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace openlink_relay::transport {

enum class http_method { get, post };

/**
 * @brief Outbound HTTP request.
 */
struct http_request
{
  http_method method{ http_method::get };///< Request verb
  std::string url;///< Absolute http:// or https:// URL
  std::vector<std::pair<std::string, std::string>> headers;///< Extra request headers
  std::string body;///< Request body (POST only)
  std::chrono::milliseconds timeout{ std::chrono::seconds(10) };///< Connect-to-last-byte deadline
  bool verify_peer{ true };///< Verify the server certificate chain and hostname
};

/**
 * @brief HTTP response as seen by callers: status plus body.
 */
struct http_response
{
  unsigned status{};///< HTTP status code
  std::string body;///< Response body
};

}// namespace openlink_relay::transport
