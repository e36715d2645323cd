#pragma once

#include "./project.hpp"

#include <map>
#include <optional>
#include <vector>

namespace pdg {

class dependency_graph;

/**
 * @brief The mutable set of projects used while a graph is under construction.
 *
 * All projects are added before any edge is linked. Once linking is done, the registry is moved
 * into an immutable dependency_graph.
 */
class project_registry {
    friend class dependency_graph;

    std::vector<project>           _projects;
    std::map<fs::path, project_id> _by_dir;

public:
    /**
     * @brief Add the project declared by the given manifest. The project's directory is the
     * normalized parent directory of the manifest.
     *
     * Throws `e_duplicate_project` if a project with the same directory is already present.
     */
    project_id add_project(path_ref manifest_path);

    /**
     * @brief Record that `from` depends on the project in directory `dep_dir`, and the
     * corresponding reverse edge.
     *
     * Throws `e_unresolved_dependency` if no project has the directory `dep_dir`.
     */
    void link(project_id from, path_ref dep_dir);

    std::optional<project_id> find(path_ref dir) const noexcept;

    const project& operator[](project_id id) const noexcept { return _projects[index_of(id)]; }

    std::size_t size() const noexcept { return _projects.size(); }
};

}  // namespace pdg
