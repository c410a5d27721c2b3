#pragma once

#include <string>

namespace openlink_relay::platform {

/**
 * @brief Returns the user's home directory path.
 *
 * @return Home directory path, empty if it cannot be determined
 */
[[nodiscard]] auto get_home_directory() -> std::string;

/**
 * @brief Returns the system's temporary directory path.
 *
 * @return Temporary directory path
 */
[[nodiscard]] auto get_temp_directory() -> std::string;

/**
 * @brief Expands a leading tilde (~) in path to the home directory.
 *
 * @param path Path possibly starting with ~/
 * @return Expanded path, or the input unchanged if no home directory is known
 */
[[nodiscard]] auto expand_tilde_path(const std::string &path) -> std::string;

/**
 * @brief Default location of the persisted relay state.
 *
 * Honors OPENLINK_RELAY_STORE when set, otherwise ~/.openlink/relay.json.
 *
 * @return Absolute store path
 */
[[nodiscard]] auto default_store_path() -> std::string;

}// namespace openlink_relay::platform
