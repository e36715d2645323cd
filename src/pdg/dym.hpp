#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdg {

/// The number of single-character insertions, deletions and substitutions that turn `a` into `b`
std::size_t lev_edit_distance(std::string_view a, std::string_view b);

/**
 * @brief Pick the candidate nearest to a misspelled name. Ties go to the earliest candidate.
 *
 * Returns nullopt only if there are no candidates.
 */
std::optional<std::string> did_you_mean(std::string_view                given,
                                        const std::vector<std::string>& candidates);

}  // namespace pdg
