#pragma once

#include <fmt/core.h>

#include <string_view>

namespace pdg::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

/// Messages below this level are dropped before they are formatted
inline level current_log_level = level::info;

inline bool enabled(level l) noexcept { return l >= current_log_level && l != level::silent; }

/**
 * @brief Install the process-wide logger. Log output is written to stderr, leaving stdout for
 * reports.
 */
void init_logger() noexcept;

void log_print(level l, std::string_view message) noexcept;

/// Format `fmt_str` with `args` and log the result at level `l`
template <typename... Args>
void log(level l, std::string_view fmt_str, const Args&... args) noexcept {
    if (enabled(l)) {
        log_print(l, fmt::format(fmt::runtime(fmt_str), args...));
    }
}

}  // namespace pdg::log

/// Log at the named level: pdg_log(debug, "Found [{}]", path.string()). Arguments to a disabled
/// level are not evaluated.
#define pdg_log(Level, ...)                                                                        \
    do {                                                                                           \
        if (::pdg::log::enabled(::pdg::log::level::Level)) {                                       \
            ::pdg::log::log(::pdg::log::level::Level, __VA_ARGS__);                                \
        }                                                                                          \
    } while (0)
