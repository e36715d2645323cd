#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pdg {

/**
 * @brief Base of error objects for a name that was looked up and not found. `nearest` is the known
 * name closest to the one given.
 */
struct e_nonesuch {
    std::string                given;
    std::optional<std::string> nearest;

    e_nonesuch(std::string_view given_, std::optional<std::string> nearest_)
        : given(given_)
        , nearest(std::move(nearest_)) {}

    /// Log `fmt_str`, formatted with the given name, followed by a "did you mean" hint
    void log_error(std::string_view fmt_str) const;
};

/// Shown in LEAF diagnostic output
std::ostream& operator<<(std::ostream& out, const e_nonesuch& err);

}  // namespace pdg
