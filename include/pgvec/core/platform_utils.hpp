#pragma once

#include <cstdlib>
#include <optional>
#include <string>

namespace pgvec::core {

/** \brief Copy of an environment variable, or nullopt when it is unset.
 *
 * A variable that is set to the empty string yields an engaged, empty value so callers
 * can tell "unset" from "set to nothing". On MSVC the lookup goes through _dupenv_s
 * because getenv is flagged there as unsafe.
 */
inline auto read_env(const char* name) noexcept -> std::optional<std::string> {
    if (name == nullptr || name[0] == '\0') return std::nullopt;
#if defined(_WIN32)
    char* raw = nullptr;
    std::size_t raw_len = 0;
    if (_dupenv_s(&raw, &raw_len, name) != 0 || raw == nullptr) {
        std::free(raw);
        return std::nullopt;
    }
    std::optional<std::string> out{std::string(raw)};
    std::free(raw);
    return out;
#else
    if (const char* raw = std::getenv(name)) return std::string(raw);
    return std::nullopt;
#endif
}

// On/off switch: set, non-empty and not starting with '0'.
inline auto env_flag_enabled(const char* name) noexcept -> bool {
    const auto v = read_env(name);
    return v.has_value() && !v->empty() && v->front() != '0';
}

} // namespace pgvec::core
