#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace openlink_relay::address {

/// Why a Web3 lookup failed
enum class resolution_failure : std::uint8_t { domain_not_found, network_error, invalid_response };

[[nodiscard]] auto to_string(resolution_failure failure) -> std::string_view;

/**
 * @brief Thrown when a Web3 domain cannot be resolved to an endpoint.
 *
 * Callers may fall back to the literal address.
 */
class resolution_error : public std::runtime_error
{
public:
  resolution_error(resolution_failure failure, const std::string &message);

  [[nodiscard]] auto failure() const noexcept -> resolution_failure { return failure_; }

private:
  resolution_failure failure_;
};

}// namespace openlink_relay::address
