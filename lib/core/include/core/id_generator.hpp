#pragma once

#include <cstddef>
#include <string>

namespace openlink_relay::core {

/**
 * @brief Generates identifiers for relay connections and sessions.
 */
class id_generator
{
public:
  /// Minimum number of alphanumeric characters in a session id
  static constexpr std::size_t session_id_min_body = 20;
  /// Maximum number of alphanumeric characters in a session id
  static constexpr std::size_t session_id_max_body = 24;
  /// Shortest session id including separators (20 characters in three groups)
  static constexpr std::size_t session_id_min_length = 22;
  /// Longest session id including separators (24 characters in five groups)
  static constexpr std::size_t session_id_max_length = 28;

  /**
   * @brief Generates a connection identifier.
   *
   * @return "c_" followed by an RFC 4122 random UUID
   */
  [[nodiscard]] static auto connection_id() -> std::string;

  /**
   * @brief Generates a shareable session identifier.
   *
   * 20-24 alphanumeric characters drawn uniformly from [A-Za-z0-9], with a '-' or '_'
   * separator inserted every 5-7 characters. Separators never lead, trail,
   * or repeat, so the full id is 22-28 characters long. The alphanumeric body
   * alone carries at least 119 bits.
   *
   * @return Session id such as "sNkjVd-owPoRT9_325fyb-v0Q"
   */
  [[nodiscard]] static auto session_id() -> std::string;
};

}// namespace openlink_relay::core
