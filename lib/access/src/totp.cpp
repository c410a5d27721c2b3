#include <access/totp.hpp>

#include <array>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <stdexcept>

namespace openlink_relay::access {

namespace {

  constexpr std::uint32_t code_modulus = 1'000'000;

  auto time_step(std::chrono::system_clock::time_point now) -> std::int64_t
  {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
    return seconds.count() / totp_step.count();
  }

}// namespace

auto hotp(std::span<const std::uint8_t> key, std::uint64_t counter) -> std::string
{
  static constexpr std::size_t counter_bytes = 8;
  static constexpr unsigned byte_bits = 8;

  std::array<std::uint8_t, counter_bytes> message{};
  for (std::size_t i = 0; i < counter_bytes; ++i) {
    message.at(counter_bytes - 1 - i) = static_cast<std::uint8_t>(counter >> (i * byte_bits));
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_length = 0;
  if (HMAC(EVP_sha1(),
        key.data(),
        static_cast<int>(key.size()),
        message.data(),
        message.size(),
        digest.data(),
        &digest_length)
      == nullptr) {
    throw std::runtime_error("HMAC-SHA1 failed");
  }

  const auto offset = static_cast<std::size_t>(digest.at(digest_length - 1) & 0x0FU);
  const std::uint32_t binary = ((static_cast<std::uint32_t>(digest.at(offset)) & 0x7FU) << 24U)
                               | (static_cast<std::uint32_t>(digest.at(offset + 1)) << 16U)
                               | (static_cast<std::uint32_t>(digest.at(offset + 2)) << 8U)
                               | static_cast<std::uint32_t>(digest.at(offset + 3));

  auto code = std::to_string(binary % code_modulus);
  code.insert(0, totp_digits - code.size(), '0');
  return code;
}

auto totp(std::span<const std::uint8_t> key, std::chrono::system_clock::time_point now) -> std::string
{
  return hotp(key, static_cast<std::uint64_t>(time_step(now)));
}

auto verify_totp(std::span<const std::uint8_t> key, std::string_view code, std::chrono::system_clock::time_point now)
  -> bool
{
  if (code.size() != totp_digits or key.empty()) { return false; }

  const auto current = time_step(now);
  bool matched = false;
  for (int drift = -totp_drift_steps; drift <= totp_drift_steps; ++drift) {
    const auto step = current + drift;
    if (step < 0) { continue; }
    const auto expected = hotp(key, static_cast<std::uint64_t>(step));
    if (CRYPTO_memcmp(expected.data(), code.data(), totp_digits) == 0) { matched = true; }
  }
  return matched;
}

}// namespace openlink_relay::access
