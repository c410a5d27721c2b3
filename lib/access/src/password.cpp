#include <access/password.hpp>
#include <core/secure_random.hpp>

#include <boost/algorithm/hex.hpp>
#include <iterator>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <vector>

namespace openlink_relay::access {

namespace {

  constexpr std::size_t salt_bytes = 16;
  constexpr std::size_t key_bytes = 32;

  auto derive(std::string_view password, const std::vector<unsigned char> &salt, std::uint32_t iterations)
    -> std::vector<unsigned char>
  {
    std::vector<unsigned char> key(key_bytes);
    if (PKCS5_PBKDF2_HMAC(password.data(),
          static_cast<int>(password.size()),
          salt.data(),
          static_cast<int>(salt.size()),
          static_cast<int>(iterations),
          EVP_sha256(),
          static_cast<int>(key.size()),
          key.data())
        != 1) {
      throw std::runtime_error("PBKDF2 key derivation failed");
    }
    return key;
  }

  auto to_hex(const std::vector<unsigned char> &bytes) -> std::string
  {
    std::string hex;
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
  }

}// namespace

auto hash_password(std::string_view password) -> password_digest
{
  const auto random = core::random_bytes(salt_bytes);
  std::vector<unsigned char> salt;
  salt.reserve(random.size());
  for (const auto byte : random) { salt.push_back(static_cast<unsigned char>(byte)); }

  return { .salt = to_hex(salt), .hash = to_hex(derive(password, salt, password_iterations)), .iterations = password_iterations };
}

auto verify_password(std::string_view password, const password_digest &digest) -> bool
{
  if (digest.iterations == 0 or digest.hash.size() != key_bytes * 2) { return false; }

  std::vector<unsigned char> salt;
  try {
    boost::algorithm::unhex(digest.salt.begin(), digest.salt.end(), std::back_inserter(salt));
  } catch (const boost::algorithm::hex_decode_error &) {
    spdlog::warn("[access_control] Stored password salt is not valid hex");
    return false;
  }

  const auto candidate = to_hex(derive(password, salt, digest.iterations));
  return CRYPTO_memcmp(candidate.data(), digest.hash.data(), candidate.size()) == 0;
}

}// namespace openlink_relay::access
