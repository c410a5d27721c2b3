#pragma once

#include <string>
#include <string_view>

namespace openlink_relay::address {

/**
 * @brief Extracts the relay endpoint from a DNS-over-HTTPS JSON answer.
 *
 * Looks for a TXT record of the form "openlink=<endpoint>". A missing record or
 * NXDOMAIN falls back to "wss://<domain>".
 *
 * @param body application/dns-json response body
 * @param domain Domain that was queried (without the _openlink prefix)
 * @return Endpoint URL
 * @throws resolution_error with invalid_response if the body is not a DoH answer
 */
[[nodiscard]] auto endpoint_from_doh_answer(std::string_view body, std::string_view domain) -> std::string;

/**
 * @brief Extracts the relay endpoint from a domain registry record set.
 *
 * "openlink.server" wins; an IPFS website record falls back to "wss://<domain>".
 *
 * @param body Registry JSON response body
 * @param domain Domain that was queried
 * @return Endpoint URL
 * @throws resolution_error with domain_not_found if no usable record exists,
 *         invalid_response if the body is malformed
 */
[[nodiscard]] auto endpoint_from_registry_records(std::string_view body, std::string_view domain) -> std::string;

}// namespace openlink_relay::address
