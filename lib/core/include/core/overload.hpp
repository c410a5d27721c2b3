#pragma once

namespace openlink_relay::core {

/**
 * @brief Helper for std::visit with overload pattern.
 *
 * Used to dispatch decoded wire messages and outbound events:
 * @code
 * std::visit(overload{
 *   [](const protocol::join_session &msg) { ... },
 *   [](const protocol::unknown_message &msg) { ... }
 * }, message);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace openlink_relay::core
