#include <access/base32.hpp>

#include <cctype>

namespace openlink_relay::access {

namespace {

  constexpr std::string_view alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
  constexpr unsigned bits_per_char = 5;
  constexpr unsigned bits_per_byte = 8;
  constexpr unsigned char_mask = 0x1F;
  constexpr unsigned byte_mask = 0xFF;

  auto decode_char(char character) -> std::optional<unsigned>
  {
    const auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(character)));
    const auto position = alphabet.find(upper);
    if (position == std::string_view::npos) { return std::nullopt; }
    return static_cast<unsigned>(position);
  }

}// namespace

auto base32_encode(std::span<const std::uint8_t> bytes) -> std::string
{
  std::string encoded;
  encoded.reserve((bytes.size() * bits_per_byte + bits_per_char - 1) / bits_per_char);

  unsigned buffer = 0;
  unsigned bits = 0;
  for (const auto byte : bytes) {
    buffer = (buffer << bits_per_byte) | byte;
    bits += bits_per_byte;
    while (bits >= bits_per_char) {
      bits -= bits_per_char;
      encoded.push_back(alphabet[(buffer >> bits) & char_mask]);
    }
  }
  if (bits > 0) { encoded.push_back(alphabet[(buffer << (bits_per_char - bits)) & char_mask]); }
  return encoded;
}

auto base32_decode(std::string_view text) -> std::optional<std::vector<std::uint8_t>>
{
  std::vector<std::uint8_t> decoded;
  decoded.reserve(text.size() * bits_per_char / bits_per_byte);

  unsigned buffer = 0;
  unsigned bits = 0;
  for (const char character : text) {
    if (character == '=' or character == ' ' or character == '-') { continue; }
    const auto value = decode_char(character);
    if (not value) { return std::nullopt; }
    buffer = (buffer << bits_per_char) | *value;
    bits += bits_per_char;
    if (bits >= bits_per_byte) {
      bits -= bits_per_byte;
      decoded.push_back(static_cast<std::uint8_t>((buffer >> bits) & byte_mask));
    }
  }
  return decoded;
}

}// namespace openlink_relay::access
