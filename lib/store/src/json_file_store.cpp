#include <store/json_file_store.hpp>

#include <fmt/format.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace openlink_relay::store {

json_file_store::json_file_store(std::filesystem::path path)
  : path_(std::move(path)), document_(nlohmann::json::object())
{
  std::error_code error;
  if (not std::filesystem::exists(path_, error)) {
    spdlog::debug("[json_file_store] No store at {}, starting empty", path_.string());
    return;
  }

  std::ifstream input(path_);
  if (not input) {
    spdlog::warn("[json_file_store] Cannot open {}, starting empty", path_.string());
    return;
  }

  try {
    auto parsed = nlohmann::json::parse(input);
    if (parsed.is_object()) {
      document_ = std::move(parsed);
    } else {
      spdlog::warn("[json_file_store] {} does not hold a JSON object, starting empty", path_.string());
    }
  } catch (const nlohmann::json::parse_error &e) {
    spdlog::warn("[json_file_store] Corrupt store {}: {}", path_.string(), e.what());
  }
}

auto json_file_store::get(const std::string &key) -> std::optional<nlohmann::json>
{
  const std::scoped_lock lock(mutex_);
  if (not document_.contains(key)) { return std::nullopt; }
  return document_.at(key);
}

auto json_file_store::set(const std::string &key, const nlohmann::json &value) -> void
{
  const std::scoped_lock lock(mutex_);
  document_[key] = value;
  flush();
}

auto json_file_store::flush() const -> void
{
  if (path_.has_parent_path()) {
    std::error_code error;
    std::filesystem::create_directories(path_.parent_path(), error);
    if (error) {
      throw std::runtime_error(
        fmt::format("Cannot create store directory {}: {}", path_.parent_path().string(), error.message()));
    }
  }

  auto temp_path = path_;
  temp_path += ".tmp";

  {
    std::ofstream output(temp_path, std::ios::trunc);
    if (not output) { throw std::runtime_error(fmt::format("Cannot write store {}", temp_path.string())); }
    static constexpr int indent = 2;
    output << document_.dump(indent);
    if (not output) { throw std::runtime_error(fmt::format("Short write to store {}", temp_path.string())); }
  }

  std::error_code error;
  std::filesystem::rename(temp_path, path_, error);
  if (error) { throw std::runtime_error(fmt::format("Cannot replace store {}: {}", path_.string(), error.message())); }
}

}// namespace openlink_relay::store
