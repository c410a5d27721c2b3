#pragma once

#include <concepts/key_value_store.hpp>

#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace openlink_relay::store {

/**
 * @brief Process-local key-value store, used when nothing should outlive the process.
 */
class memory_store
{
public:
  [[nodiscard]] auto get(const std::string &key) -> std::optional<nlohmann::json>
  {
    const std::scoped_lock lock(mutex_);
    auto iter = values_.find(key);
    if (iter == values_.end()) { return std::nullopt; }
    return iter->second;
  }

  auto set(const std::string &key, const nlohmann::json &value) -> void
  {
    const std::scoped_lock lock(mutex_);
    values_[key] = value;
  }

private:
  std::mutex mutex_;
  std::unordered_map<std::string, nlohmann::json> values_;
};

static_assert(concepts::key_value_store<memory_store>);

}// namespace openlink_relay::store
