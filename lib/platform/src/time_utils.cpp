#include <platform/time_utils.hpp>

#include <ctime>
#include <fmt/format.h>
#include <tuple>

namespace openlink_relay::platform {

auto system_wall_clock() -> wall_clock_t
{
  return [] { return std::chrono::system_clock::now(); };
}

auto system_steady_clock() -> steady_clock_t
{
  return [] { return std::chrono::steady_clock::now(); };
}

auto to_unix_millis(std::chrono::system_clock::time_point time_point) -> std::uint64_t
{
  return static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count());
}

auto format_iso8601(std::chrono::system_clock::time_point time_point) -> std::string
{
  const std::time_t time_value = std::chrono::system_clock::to_time_t(time_point);

  std::tm time_tm{};
#if defined(_WIN32)
  std::ignore = gmtime_s(&time_tm, &time_value);
#else
  std::ignore = gmtime_r(&time_value, &time_tm);
#endif

  static constexpr int tm_year_base = 1900;
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
    time_tm.tm_year + tm_year_base,
    time_tm.tm_mon + 1,
    time_tm.tm_mday,
    time_tm.tm_hour,
    time_tm.tm_min,
    time_tm.tm_sec);
}

}// namespace openlink_relay::platform
