#pragma once

#include "./project.hpp"
#include "./registry.hpp"

#include <pdg/project/discover.hpp>

#include <optional>
#include <span>

namespace pdg {

/**
 * @brief A fully linked, immutable graph of projects and their path dependencies.
 */
class dependency_graph {
    std::vector<project>           _projects;
    std::map<fs::path, project_id> _by_dir;

public:
    explicit dependency_graph(project_registry&& reg) noexcept
        : _projects(std::move(reg._projects))
        , _by_dir(std::move(reg._by_dir)) {}

    /// All projects, in discovery order. A project's index is its project_id.
    std::span<const project> projects() const noexcept { return _projects; }

    const project& operator[](project_id id) const noexcept { return _projects[index_of(id)]; }

    std::size_t size() const noexcept { return _projects.size(); }

    project_id id_of(const project& p) const noexcept {
        return project_id{static_cast<std::size_t>(&p - _projects.data())};
    }

    /// Find the project whose normalized directory is `dir`
    std::optional<project_id> find(path_ref dir) const noexcept;
};

/**
 * @brief Discover every project beneath `opts.root`, extract their path dependencies, and link
 * them into a graph.
 *
 * Throws if the tree cannot be scanned, a manifest cannot be read, or a declared dependency
 * names an existing directory that is not a project (`e_unresolved_dependency`).
 */
dependency_graph build_graph(const discover_options& opts);

}  // namespace pdg
