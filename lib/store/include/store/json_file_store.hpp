#pragma once

#include <concepts/key_value_store.hpp>

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace openlink_relay::store {

/**
 * @brief Key-value store persisted as a single JSON object on disk.
 *
 * The file is read once on construction. Every set() rewrites the file through a
 * temporary sibling and a rename, so a crash never leaves a truncated document.
 */
class json_file_store
{
public:
  /**
   * @brief Opens (or prepares to create) a store file.
   *
   * A missing file starts empty. An unreadable or corrupt file is logged and
   * also starts empty; it is replaced on the next set().
   *
   * @param path Location of the JSON document
   */
  explicit json_file_store(std::filesystem::path path);

  [[nodiscard]] auto get(const std::string &key) -> std::optional<nlohmann::json>;

  /**
   * @brief Stores a value and flushes the document to disk.
   *
   * @throws std::runtime_error if the file cannot be written
   */
  auto set(const std::string &key, const nlohmann::json &value) -> void;

  [[nodiscard]] auto path() const -> const std::filesystem::path & { return path_; }

private:
  auto flush() const -> void;

  std::filesystem::path path_;
  std::mutex mutex_;
  nlohmann::json document_;
};

static_assert(concepts::key_value_store<json_file_store>);

}// namespace openlink_relay::store
