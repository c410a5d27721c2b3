#include <core/id_generator.hpp>
#include <core/secure_random.hpp>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <string_view>

namespace openlink_relay::core {

auto id_generator::connection_id() -> std::string
{
  static thread_local boost::uuids::random_generator gen;
  return "c_" + boost::uuids::to_string(gen());
}

auto id_generator::session_id() -> std::string
{
  static constexpr std::string_view alphabet = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
  static constexpr std::string_view separators = "-_";
  static constexpr std::size_t min_gap = 5;
  static constexpr std::size_t gap_choices = 3;

  const auto body_length = session_id_min_body + random_index(session_id_max_body - session_id_min_body + 1);

  std::string result;
  result.reserve(body_length + (body_length / min_gap));

  auto next_gap = min_gap + random_index(gap_choices);
  std::size_t since_separator = 0;

  for (std::size_t i = 0; i < body_length; ++i) {
    if (since_separator == next_gap) {
      result.push_back(separators[random_index(separators.size())]);
      since_separator = 0;
      next_gap = min_gap + random_index(gap_choices);
    }
    result.push_back(alphabet[random_index(alphabet.size())]);
    ++since_separator;
  }

  return result;
}

}// namespace openlink_relay::core
