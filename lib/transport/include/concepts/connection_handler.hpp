#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace openlink_relay::concepts {

/**
 * @brief Concept for the consumer of listener traffic.
 *
 * on_open() returns the assigned connection id, or std::nullopt when the
 * connection was refused (the handler closes the peer itself). http_get()
 * returns a JSON body for a plain HTTP GET, std::nullopt for 404.
 */
template<typename T, typename Peer>
concept connection_handler = requires(T &handler,
  std::shared_ptr<Peer> peer,
  const std::string &text,
  std::vector<std::byte> bytes) {
  { handler.on_open(peer, text) } -> std::same_as<std::optional<std::string>>;
  { handler.on_text(text, text) } -> std::same_as<void>;
  { handler.on_binary(text, std::move(bytes)) } -> std::same_as<void>;
  { handler.on_close(text) } -> std::same_as<void>;
  { handler.http_get(text) } -> std::same_as<std::optional<std::string>>;
};

}// namespace openlink_relay::concepts
