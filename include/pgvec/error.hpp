#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (a database driver maps them to row-level failures).
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace pgvec::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  config_invalid = 2001,
  data_integrity = 3001,
  format_error = 3002,     /**< wire bytes disagree with the layout of the requested kind */
  precondition_failed = 4001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
  unsupported = 9005,
  type_error = 9006,       /**< adapter was offered a value of an unsupported type */
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "vector.sparse" */
};

/** \brief Stable short name of an error code, e.g. "format_error". */
constexpr std::string_view error_code_name(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::format_error: return "format_error";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
    case error_code::unsupported: return "unsupported";
    case error_code::type_error: return "type_error";
  }
  return "unknown";
}

} // namespace pgvec::core
