#include <platform/env_utils.hpp>

#include <cstdlib>
#include <mutex>

#ifdef _WIN32
#include <memory>
#endif

namespace openlink_relay::platform {

namespace {

  auto read_env(const char *name) -> std::string
  {
#ifdef _WIN32
    char *value_raw = nullptr;
    size_t len = 0;
    if (_dupenv_s(&value_raw, &len, name) == 0 and value_raw != nullptr) {
      const std::unique_ptr<char, decltype(&free)> value(value_raw, &free);
      return { value.get() };
    }
    return "";
#else
    static std::mutex env_mutex;
    const std::scoped_lock lock(env_mutex);

    const char *value = std::getenv(name);// NOLINT(concurrency-mt-unsafe)
    return value != nullptr ? std::string(value) : "";
#endif
  }

}// namespace

auto get_home_directory() -> std::string
{
#ifdef _WIN32
  return read_env("USERPROFILE");
#else
  return read_env("HOME");
#endif
}

auto get_temp_directory() -> std::string
{
#ifdef _WIN32
  auto temp = read_env("TEMP");
  return temp.empty() ? "C:\\temp" : temp;
#else
  auto temp = read_env("TMPDIR");
  return temp.empty() ? "/tmp" : temp;
#endif
}

auto expand_tilde_path(const std::string &path) -> std::string
{
  if (not path.starts_with("~/")) { return path; }

  auto home = get_home_directory();
  if (home.empty()) { return path; }

  return home + path.substr(1);
}

auto default_store_path() -> std::string
{
  auto configured = read_env("OPENLINK_RELAY_STORE");
  if (not configured.empty()) { return expand_tilde_path(configured); }
  return expand_tilde_path("~/.openlink/relay.json");
}

}// namespace openlink_relay::platform
