#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling; values never change once released.
 * - Human-readable message and originating component for diagnostics.
 * - Persistence failures span two codes (io_failed, data_integrity); use
 *   is_persistence_error() rather than comparing against either one.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace ticketsim::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  config_invalid = 2001,
  data_integrity = 3001,
  precondition_failed = 4001,
  not_found = 6001,
  provider_failed = 7002,
  internal = 9001,
  invalid_argument = 9002,
  not_initialized = 9003,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.hnsw" */
};

/** \brief Missing, unreadable, corrupt or incompatible persisted state. */
constexpr bool is_persistence_error(error_code ec) noexcept {
  return ec == error_code::io_failed || ec == error_code::data_integrity;
}

constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_found: return "not_found";
    case error_code::provider_failed: return "provider_failed";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_initialized: return "not_initialized";
  }
  return "unknown";
}

/** \brief Shorthand for building an unexpected error value. */
inline auto make_error(error_code code, std::string message, std::string component)
    -> std::unexpected<error> {
  return std::unexpected(error{code, std::move(message), std::move(component)});
}

} // namespace ticketsim::core
