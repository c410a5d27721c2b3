#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace openlink_relay::access {

/// RFC 6238 time step
inline constexpr std::chrono::seconds totp_step{ 30 };

/// Code length
inline constexpr std::size_t totp_digits{ 6 };

/// Adjacent steps accepted on either side of the current one
inline constexpr int totp_drift_steps{ 1 };

/**
 * @brief RFC 4226 HOTP with HMAC-SHA1 and dynamic truncation.
 *
 * @param key Shared secret
 * @param counter Moving factor
 * @return Zero-padded totp_digits code
 * @throws std::runtime_error if HMAC computation fails
 */
[[nodiscard]] auto hotp(std::span<const std::uint8_t> key, std::uint64_t counter) -> std::string;

/**
 * @brief RFC 6238 code for the step containing a time.
 */
[[nodiscard]] auto totp(std::span<const std::uint8_t> key, std::chrono::system_clock::time_point now) -> std::string;

/**
 * @brief Checks a code against the current step and totp_drift_steps on each side.
 *
 * @param key Shared secret
 * @param code Code submitted by the client
 * @param now Current time
 * @return true if any step in the window produces the code
 */
[[nodiscard]] auto verify_totp(std::span<const std::uint8_t> key,
  std::string_view code,
  std::chrono::system_clock::time_point now) -> bool;

}// namespace openlink_relay::access
