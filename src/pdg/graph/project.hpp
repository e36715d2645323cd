#pragma once

#include <pdg/util/fs/path.hpp>

#include <cstddef>
#include <vector>

namespace pdg {

/**
 * @brief Identifies a project within the graph that owns it. IDs are dense indices assigned in
 * discovery order.
 */
enum class project_id : std::size_t {};

constexpr std::size_t index_of(project_id id) noexcept { return static_cast<std::size_t>(id); }

/**
 * @brief A directory holding a manifest, along with the edges to and from it.
 *
 * Every entry in `dependencies` has a matching entry in the dependent's `dependents`, and vice
 * versa. Duplicate declarations yield duplicate entries.
 */
struct project {
    /// The normalized directory of the project, relative to the scan root. Unique in a graph.
    fs::path dir;
    /// The manifest file that declared this project, relative to the scan root
    fs::path manifest_path;

    /// Projects this one declares a path dependency on, in order of declaration
    std::vector<project_id> dependencies{};
    /// Projects declaring a dependency on this one, in the order the edges were linked
    std::vector<project_id> dependents{};
};

}  // namespace pdg
