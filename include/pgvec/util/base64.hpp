#pragma once

/** \file base64.hpp
 *  \brief RFC 4648 base64 decoding (standard alphabet, '=' padding).
 *
 * ASCII whitespace is skipped. Any other character outside the alphabet, misplaced
 * padding, or a length that is not a whole number of quanta is a format_error.
 */

#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

#include "pgvec/error.hpp"

namespace pgvec::util {

auto base64_decode(std::string_view text) -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace pgvec::util
