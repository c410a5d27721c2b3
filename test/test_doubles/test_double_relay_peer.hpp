#pragma once

#include <concepts/relay_peer.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace openlink_relay::test {

/// Records every frame the relay sends to one client
class test_double_relay_peer
{
public:
  auto send_text(std::string text) -> void
  {
    const std::scoped_lock lock(mutex_);
    if (open_) { texts_.push_back(std::move(text)); }
  }

  auto send_binary(std::vector<std::byte> bytes) -> void
  {
    const std::scoped_lock lock(mutex_);
    if (open_) { binaries_.push_back(std::move(bytes)); }
  }

  auto close() -> void
  {
    const std::scoped_lock lock(mutex_);
    open_ = false;
    ++close_calls_;
  }

  [[nodiscard]] auto is_open() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return open_;
  }

  [[nodiscard]] auto messages() const -> std::vector<nlohmann::json>
  {
    const std::scoped_lock lock(mutex_);
    std::vector<nlohmann::json> parsed;
    parsed.reserve(texts_.size());
    for (const auto &text : texts_) { parsed.push_back(nlohmann::json::parse(text)); }
    return parsed;
  }

  [[nodiscard]] auto messages_of_type(const std::string &type) const -> std::vector<nlohmann::json>
  {
    auto all = messages();
    std::vector<nlohmann::json> matching;
    std::ranges::copy_if(all, std::back_inserter(matching), [&type](const auto &msg) { return msg.value("type", "") == type; });
    return matching;
  }

  [[nodiscard]] auto last_message() const -> std::optional<nlohmann::json>
  {
    auto all = messages();
    if (all.empty()) { return std::nullopt; }
    return all.back();
  }

  [[nodiscard]] auto binaries() const -> std::vector<std::vector<std::byte>>
  {
    const std::scoped_lock lock(mutex_);
    return binaries_;
  }

  [[nodiscard]] auto close_calls() const -> int
  {
    const std::scoped_lock lock(mutex_);
    return close_calls_;
  }

  auto clear() -> void
  {
    const std::scoped_lock lock(mutex_);
    texts_.clear();
    binaries_.clear();
  }

private:
  mutable std::mutex mutex_;
  bool open_{ true };
  int close_calls_{ 0 };
  std::vector<std::string> texts_;
  std::vector<std::vector<std::byte>> binaries_;
};

static_assert(concepts::relay_peer<test_double_relay_peer>);

}// namespace openlink_relay::test
