#include <address/resolution_error.hpp>
#include <address/web3_records.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace openlink_relay::address {

namespace {

  constexpr std::string_view txt_prefix = "openlink=";
  constexpr std::string_view server_record = "openlink.server";
  constexpr std::string_view ipfs_record = "ipfs.html.value";
  constexpr int dns_nxdomain = 3;

  auto parse_object(std::string_view body) -> nlohmann::json
  {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() or not json.is_object()) {
      throw resolution_error(resolution_failure::invalid_response, "response is not a JSON object");
    }
    return json;
  }

  auto strip_quotes(std::string text) -> std::string
  {
    std::erase(text, '"');
    return text;
  }

}// namespace

resolution_error::resolution_error(resolution_failure failure, const std::string &message)
  : std::runtime_error(message), failure_(failure)
{}

auto to_string(resolution_failure failure) -> std::string_view
{
  switch (failure) {
  case resolution_failure::domain_not_found:
    return "domain_not_found";
  case resolution_failure::network_error:
    return "network_error";
  case resolution_failure::invalid_response:
    break;
  }
  return "invalid_response";
}

auto endpoint_from_doh_answer(std::string_view body, std::string_view domain) -> std::string
{
  const auto json = parse_object(body);
  const auto fallback = fmt::format("wss://{}", domain);

  if (json.contains("Status") and json["Status"].is_number_integer() and json["Status"].get<int>() == dns_nxdomain) {
    spdlog::debug("[web3_resolver] No _openlink record for {}, using {}", domain, fallback);
    return fallback;
  }

  if (not json.contains("Answer")) { return fallback; }
  if (not json["Answer"].is_array()) {
    throw resolution_error(resolution_failure::invalid_response, "DoH Answer is not an array");
  }

  for (const auto &answer : json["Answer"]) {
    if (not answer.is_object() or not answer.contains("data") or not answer["data"].is_string()) { continue; }
    const auto record = strip_quotes(answer["data"].get<std::string>());
    if (record.starts_with(txt_prefix) and record.size() > txt_prefix.size()) { return record.substr(txt_prefix.size()); }
  }

  spdlog::debug("[web3_resolver] TXT records for {} carry no endpoint, using {}", domain, fallback);
  return fallback;
}

auto endpoint_from_registry_records(std::string_view body, std::string_view domain) -> std::string
{
  const auto json = parse_object(body);
  if (not json.contains("records") or not json["records"].is_object()) {
    throw resolution_error(resolution_failure::invalid_response, "registry response has no records object");
  }

  const auto &records = json["records"];
  if (const auto server = records.find(server_record);
      server != records.end() and server->is_string() and not server->get<std::string>().empty()) {
    return server->get<std::string>();
  }

  if (records.contains(ipfs_record)) { return fmt::format("wss://{}", domain); }

  throw resolution_error(resolution_failure::domain_not_found, fmt::format("No OpenLink record found for {}", domain));
}

}// namespace openlink_relay::address
