#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace openlink_relay::core {

/**
 * @brief Fills a buffer from the OpenSSL CSPRNG.
 *
 * @param count Number of bytes
 * @return Random bytes
 * @throws std::runtime_error if the CSPRNG is not seeded
 */
[[nodiscard]] auto random_bytes(std::size_t count) -> std::vector<std::byte>;

/**
 * @brief Uniform random index in [0, bound) without modulo bias.
 *
 * @param bound Exclusive upper bound, must be non-zero
 * @return Random index
 * @throws std::invalid_argument if bound is zero
 */
[[nodiscard]] auto random_index(std::size_t bound) -> std::size_t;

/**
 * @brief String of uniformly random decimal digits (leading zeros allowed).
 *
 * @param count Number of digits
 * @return Digit string
 */
[[nodiscard]] auto random_digits(std::size_t count) -> std::string;

}// namespace openlink_relay::core
