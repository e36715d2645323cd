#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace fansi {

enum class should_style {
    /// Style only if stderr, where diagnostics go, is a terminal
    detect,
    force,
    never,
};

/**
 * @brief Render inline style markup as ANSI escape sequences, or strip it.
 *
 * `.bold.red[text]` applies each dotted class to `text`. A class is a color name (`red`,
 * `yellow`, ...), `br` for the bright variant of the color, or one of `bold`, `italic` and
 * `underline`. Styles nest. A backtick makes the next character literal. A dot that is not followed
 * by known classes and a '[' is ordinary text.
 */
std::string stylize(std::string_view text, should_style = should_style::detect);

namespace detail {
const std::string& rendered_literal(const char* literal);
}

inline namespace literals {

/// Render a markup literal once per thread, for use as a format string
inline const std::string& operator""_styled(const char* str, std::size_t) {
    return detail::rendered_literal(str);
}

}  // namespace literals

}  // namespace fansi
