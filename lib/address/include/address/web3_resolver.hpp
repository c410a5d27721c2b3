#pragma once

#include <address/address.hpp>
#include <address/resolution_error.hpp>
#include <address/web3_records.hpp>
#include <concepts/http_client.hpp>
#include <transport/http_types.hpp>
#include <transport/url.hpp>

#include <boost/asio/awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <chrono>
#include <fmt/format.h>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace openlink_relay::address {

/**
 * @brief Endpoints and credentials for Web3 lookups.
 */
struct resolver_options
{
  std::string doh_endpoint{ "https://cloudflare-dns.com/dns-query" };///< DNS-over-HTTPS JSON API
  std::string registry_endpoint{ "https://resolve.unstoppabledomains.com" };///< Domain registry API base
  std::optional<std::string> api_key;///< Bearer token for the registry, if required
  std::chrono::milliseconds timeout{ std::chrono::seconds(10) };///< Per-request deadline
  parse_options parse;///< Suffix lists used by build_server_url()
};

/**
 * @brief Resolves ENS-style and Unstoppable-style domains to relay endpoints.
 *
 * @tparam HttpClient Type satisfying concepts::http_client
 */
template<concepts::http_client HttpClient> class web3_resolver
{
public:
  web3_resolver(std::shared_ptr<HttpClient> client, resolver_options options = {})
    : client_(std::move(client)), options_(std::move(options))
  {}

  /**
   * @brief Resolves a Web3 domain.
   *
   * @param host Domain name
   * @param kind address_kind::ens or address_kind::unstoppable
   * @return Awaitable yielding the endpoint URL
   * @throws resolution_error on lookup failure
   * @throws std::invalid_argument if kind is not a Web3 kind
   */
  auto resolve(std::string host, address_kind kind) -> boost::asio::awaitable<std::string>
  {
    if (kind == address_kind::ens) { co_return co_await resolve_ens(host); }
    if (kind == address_kind::unstoppable) { co_return co_await resolve_unstoppable(host); }
    throw std::invalid_argument(fmt::format("{} is not a Web3 domain ({})", host, to_string(kind)));
  }

  /**
   * @brief Turns a stored server address into a connectable URL.
   *
   * Web3 domains are resolved; every other address is returned unchanged.
   *
   * @param url Address or URL
   * @return Awaitable yielding the URL to connect to
   * @throws resolution_error when a Web3 lookup fails
   */
  auto build_server_url(std::string url) -> boost::asio::awaitable<std::string>
  {
    const auto parsed = parse(url, options_.parse);
    if (not parsed.requires_resolution) { co_return url; }

    auto endpoint = co_await resolve(parsed.host, parsed.kind);
    spdlog::info("[web3_resolver] {} resolved to {}", url, endpoint);
    co_return endpoint;
  }

  [[nodiscard]] auto options() const -> const resolver_options & { return options_; }

private:
  auto resolve_ens(const std::string &domain) -> boost::asio::awaitable<std::string>
  {
    transport::http_request request{ .method = transport::http_method::get,
      .url = fmt::format("{}?name={}&type=TXT", options_.doh_endpoint, transport::url_encode("_openlink." + domain)),
      .headers = { { "Accept", "application/dns-json" } },
      .body = {},
      .timeout = options_.timeout };

    const auto response = co_await fetch(std::move(request), domain);
    co_return endpoint_from_doh_answer(response.body, domain);
  }

  auto resolve_unstoppable(const std::string &domain) -> boost::asio::awaitable<std::string>
  {
    transport::http_request request{ .method = transport::http_method::get,
      .url = fmt::format("{}/domains/{}", options_.registry_endpoint, transport::url_encode(domain)),
      .headers = { { "Accept", "application/json" } },
      .body = {},
      .timeout = options_.timeout };
    if (options_.api_key) { request.headers.emplace_back("Authorization", fmt::format("Bearer {}", *options_.api_key)); }

    const auto response = co_await fetch(std::move(request), domain);
    co_return endpoint_from_registry_records(response.body, domain);
  }

  auto fetch(transport::http_request request, const std::string &domain) -> boost::asio::awaitable<transport::http_response>
  {
    static constexpr unsigned status_ok = 200;
    static constexpr unsigned status_not_found = 404;

    std::optional<transport::http_response> response;
    std::string failure;
    try {
      response = co_await client_->request(std::move(request));
    } catch (const boost::system::system_error &err) {
      failure = err.what();
    } catch (const std::invalid_argument &err) {
      failure = err.what();
    }

    if (not response) {
      spdlog::warn("[web3_resolver] Lookup for {} failed: {}", domain, failure);
      throw resolution_error(resolution_failure::network_error, failure);
    }
    if (response->status == status_not_found) {
      throw resolution_error(resolution_failure::domain_not_found, fmt::format("{} not found", domain));
    }
    if (response->status != status_ok) {
      throw resolution_error(
        resolution_failure::network_error, fmt::format("lookup for {} returned HTTP {}", domain, response->status));
    }
    co_return *std::move(response);
  }

  std::shared_ptr<HttpClient> client_;
  resolver_options options_;
};

}// namespace openlink_relay::address
