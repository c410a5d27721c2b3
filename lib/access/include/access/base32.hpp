#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace openlink_relay::access {

/**
 * @brief RFC 4648 base32 without padding, as used by authenticator apps.
 */
[[nodiscard]] auto base32_encode(std::span<const std::uint8_t> bytes) -> std::string;

/**
 * @brief Decodes RFC 4648 base32. Case-insensitive; padding and spaces are skipped.
 *
 * @return Decoded bytes, or std::nullopt on a character outside the alphabet
 */
[[nodiscard]] auto base32_decode(std::string_view text) -> std::optional<std::vector<std::uint8_t>>;

}// namespace openlink_relay::access
