#pragma once

/** \file log.hpp
 *  \brief Opt-in diagnostic tracing to stderr.
 *
 * Tracing is off unless PGVEC_CODEC_DEBUG is set to a non-empty value not starting with '0'.
 * The flag is read once per process. Lines look like "[pgvec][codec] message".
 */

#include <string_view>

#include "pgvec/error.hpp"

namespace pgvec::core {

/** \brief Whether PGVEC_CODEC_DEBUG tracing is enabled (cached after first call). */
auto debug_enabled() noexcept -> bool;

/** \brief Write one trace line tagged with \p subsystem; no-op when tracing is disabled. */
void debug_log(std::string_view subsystem, std::string_view message);

/** \brief Trace an error payload as "<code_name> (<component>): <message>". */
void debug_log_error(std::string_view subsystem, const error& e);

} // namespace pgvec::core
