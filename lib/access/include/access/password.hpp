#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace openlink_relay::access {

/**
 * @brief Salted PBKDF2-HMAC-SHA256 password digest. Plaintext is never stored.
 */
struct password_digest
{
  std::string salt;///< Hex-encoded random salt
  std::string hash;///< Hex-encoded derived key
  std::uint32_t iterations{};///< PBKDF2 iteration count
};

/// Iterations used for new digests
inline constexpr std::uint32_t password_iterations{ 100'000 };

/**
 * @brief Derives a digest with a fresh random salt.
 *
 * @throws std::runtime_error if the CSPRNG or key derivation fails
 */
[[nodiscard]] auto hash_password(std::string_view password) -> password_digest;

/**
 * @brief Recomputes the digest with the stored salt and compares in constant time.
 *
 * @return false for a mismatch or an unreadable digest
 */
[[nodiscard]] auto verify_password(std::string_view password, const password_digest &digest) -> bool;

}// namespace openlink_relay::access
