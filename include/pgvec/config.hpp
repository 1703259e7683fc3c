#pragma once

/** \file config.hpp
 *  \brief Codec configuration and its environment loader.
 *
 * Environment:
 *   PGVEC_SCHEMA            schema the extension types live in (SQL identifier, default "public")
 *   PGVEC_SPARSE_ASCENDING  "1"/"true" or "0"/"false" (default); reject sparse wire values whose
 *                           indices are not strictly increasing
 */

#include <expected>
#include <string>
#include <string_view>

#include "pgvec/error.hpp"
#include "pgvec/vector/sparse_vector.hpp"

namespace pgvec {

struct CodecConfig {
  std::string schema{"public"};
  bool sparse_require_ascending{false};
};

/** \brief Sparse decode options implied by \p cfg. */
auto sparse_decode_options(const CodecConfig& cfg) noexcept -> SparseDecodeOptions;

/** \brief True if \p name is a plain unquoted SQL identifier. */
auto is_sql_identifier(std::string_view name) noexcept -> bool;

/** \brief Build a CodecConfig from defaults overridden by PGVEC_* environment variables.
 *  \return config_invalid when a variable is set to a malformed value.
 */
auto load_codec_config_from_env() -> std::expected<CodecConfig, core::error>;

} // namespace pgvec
