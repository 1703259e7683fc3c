#pragma once

/** \file float_base64.hpp
 *  \brief Lossless import of a float sequence carried as base64 text.
 *
 * The payload is a raw buffer of 4-byte floats in host byte order (what a producer gets by
 * dumping its float32 array), so a value crosses a text-only boundary such as JSON without
 * going through lossy decimal formatting.
 */

#include <expected>
#include <string_view>
#include <vector>

#include "pgvec/error.hpp"

namespace pgvec {

/** \brief Decode base64 text into host-order float32 values widened to double.
 *  \return format_error for malformed base64 or a payload that is not a multiple of 4 bytes.
 */
auto decode_float_base64(std::string_view text) -> std::expected<std::vector<double>, core::error>;

} // namespace pgvec
