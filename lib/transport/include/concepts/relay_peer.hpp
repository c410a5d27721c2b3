#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <vector>

namespace openlink_relay::concepts {

/**
 * @brief Concept for the server-side end of a client connection.
 *
 * Sends are fire-and-forget and safe to call from any thread; the peer
 * serializes frames onto its socket. close() is idempotent.
 */
template<typename T>
concept relay_peer = requires(T &peer, const T &const_peer, std::string text, std::vector<std::byte> bytes) {
  { peer.send_text(std::move(text)) } -> std::same_as<void>;
  { peer.send_binary(std::move(bytes)) } -> std::same_as<void>;
  { peer.close() } -> std::same_as<void>;
  { const_peer.is_open() } -> std::same_as<bool>;
};

}// namespace openlink_relay::concepts
