#pragma once

#include <concepts>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace openlink_relay::concepts {

/**
 * @brief Concept for the opaque persisted-state store owned by the application shell.
 *
 * Components read and write whole JSON values under well-known keys and make no
 * assumption about the backing format.
 */
template<typename T>
concept key_value_store = requires(T &store, const std::string &key, const nlohmann::json &value) {
  { store.get(key) } -> std::same_as<std::optional<nlohmann::json>>;
  { store.set(key, value) } -> std::same_as<void>;
};

}// namespace openlink_relay::concepts
