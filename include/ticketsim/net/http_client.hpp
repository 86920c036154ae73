#pragma once

/** \file http_client.hpp
 *  \brief Blocking JSON POST over libcurl, shared by the HTTP provider adapters.
 *
 * Each call owns its own easy handle, so concurrent calls are safe. curl_global_init runs
 * once per process on first use.
 */

#include <chrono>
#include <expected>
#include <string>
#include <vector>

#include "ticketsim/error.hpp"

namespace ticketsim::net {

struct http_response {
  long status{0};
  std::string body;
};

struct post_options {
  std::chrono::milliseconds timeout{30000};
  std::vector<std::string> headers;   /**< extra "Name: value" lines */
};

/** \brief POST body as application/json.
 *
 * Transport failures (resolve, connect, timeout, TLS) are provider_failed. Any HTTP status
 * is returned as a response; callers decide what counts as success.
 */
auto post_json(const std::string& url, const std::string& body, const post_options& options = {})
    -> std::expected<http_response, core::error>;

/** \brief True for 2xx statuses. */
constexpr bool is_success(long status) noexcept { return status >= 200 && status < 300; }

} // namespace ticketsim::net
