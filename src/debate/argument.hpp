#pragma once

#include "./error.hpp"

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace debate {

/// Called with the value given to an argument, and with the spelling that introduced it
using action_fn = std::function<void(std::string_view value, std::string_view spelling)>;

namespace detail {

template <typename T>
constexpr bool is_optional_v = false;

template <typename T>
constexpr bool is_optional_v<std::optional<T>> = true;

/// Match a value against the kebab-case spelling of each enumerator ('very_loud' is 'very-loud')
template <typename E>
E parse_enum(std::string_view given, std::string_view spelling) {
    for (auto&& [value, ident] : magic_enum::enum_entries<E>()) {
        std::string kebab(ident);
        std::ranges::replace(kebab, '_', '-');
        if (kebab == given) {
            return value;
        }
    }
    BOOST_LEAF_THROW_EXCEPTION(invalid_arguments("Invalid value for enum-bound argument"),
                               e_invalid_arg_value{std::string(given)},
                               e_arg_spelling{std::string(spelling)});
}

}  // namespace detail

/**
 * @brief Create an action that assigns the given value to `dest`.
 *
 * Enums are assigned by enumerator name, and an unknown name is an `invalid_arguments` error.
 */
template <typename T>
action_fn put_into(T& dest) {
    return [&dest](std::string_view value, std::string_view spelling) {
        if constexpr (std::is_enum_v<T>) {
            dest = detail::parse_enum<T>(value, spelling);
        } else if constexpr (detail::is_optional_v<T>) {
            dest.emplace(value);
        } else {
            dest = T(value);
        }
    };
}

/// Create an action that appends each given value to the container `dest`
template <typename Container>
action_fn push_back_onto(Container& dest) {
    return [&dest](std::string_view value, std::string_view) { dest.emplace_back(value); };
}

/**
 * @brief A single command-line argument. Every argument takes exactly one value.
 *
 * An argument with no long or short spellings is positional.
 */
struct argument {
    std::vector<std::string> long_spellings{};
    std::vector<std::string> short_spellings{};

    std::string help{};
    std::string valname{};

    bool required   = false;
    bool can_repeat = false;

    action_fn action;

    bool is_positional() const noexcept {
        return long_spellings.empty() && short_spellings.empty();
    }

    /**
     * @brief Match the text after '--' against the long spellings of this argument.
     *
     * The text matches if it is a spelling, or a spelling followed by '=' and a value.
     */
    std::optional<std::string_view> match_long(std::string_view text) const noexcept;

    /// Match the text after '-' against the short spellings. The value may directly follow.
    std::optional<std::string_view> match_short(std::string_view text) const noexcept;

    /// The spelling shown in messages: The first long spelling, else short, else the valname
    std::string preferred_spelling() const;

    /// The argument as shown in a usage line, e.g. '[--exclude=<dirname> [...]]'
    std::string syntax_string() const;

    std::string help_string() const;
};

}  // namespace debate
