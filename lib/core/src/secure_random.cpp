#include <core/secure_random.hpp>

#include <cstdint>
#include <cstring>
#include <limits>
#include <openssl/rand.h>
#include <stdexcept>

namespace openlink_relay::core {

auto random_bytes(std::size_t count) -> std::vector<std::byte>
{
  std::vector<std::byte> bytes(count);
  if (count == 0) { return bytes; }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  if (RAND_bytes(reinterpret_cast<unsigned char *>(bytes.data()), static_cast<int>(count)) != 1) {
    throw std::runtime_error("CSPRNG failure");
  }
  return bytes;
}

auto random_index(std::size_t bound) -> std::size_t
{
  if (bound == 0) { throw std::invalid_argument("random_index bound must be non-zero"); }

  const auto range = static_cast<std::uint64_t>(bound);
  const std::uint64_t limit = std::numeric_limits<std::uint64_t>::max() - (std::numeric_limits<std::uint64_t>::max() % range);

  while (true) {
    const auto bytes = random_bytes(sizeof(std::uint64_t));
    std::uint64_t value{};
    std::memcpy(&value, bytes.data(), sizeof(value));
    if (value < limit) { return static_cast<std::size_t>(value % range); }
  }
}

auto random_digits(std::size_t count) -> std::string
{
  static constexpr std::size_t decimal_base = 10;

  std::string digits;
  digits.reserve(count);
  for (std::size_t i = 0; i < count; ++i) { digits.push_back(static_cast<char>('0' + random_index(decimal_base))); }
  return digits;
}

}// namespace openlink_relay::core
