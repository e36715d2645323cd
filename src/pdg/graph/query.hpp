#pragma once

#include "./graph.hpp"

#include <string_view>
#include <vector>

namespace pdg {

/// Every project that no other project depends on, in discovery order
std::vector<project_id> unused_projects(const dependency_graph& g);

struct single_consumer {
    /// The project with exactly one dependent
    project_id project;
    /// Its sole dependent
    project_id consumer;
};

/// Every project with exactly one dependent, paired with that dependent, in discovery order
std::vector<single_consumer> single_consumer_projects(const dependency_graph& g);

struct tree_entry {
    int        depth;
    project_id project;
};

/**
 * @brief Walk the dependencies of `root` depth-first, in declaration order.
 *
 * The root is the first entry, at depth zero. A project reachable along several paths appears
 * once for each path. If a project is reached while it is already being walked, an
 * `e_dependency_cycle` is thrown naming the cycle.
 */
std::vector<tree_entry> dependency_tree(const dependency_graph& g, project_id root);

/**
 * @brief Select a project by a name given by the user.
 *
 * An exact (normalized) directory match is preferred. Otherwise, the projects whose directory
 * contains `given` are candidates: a single candidate is selected, and among several the one whose
 * final directory component equals `given` is selected if there is exactly one such.
 *
 * Throws `e_nonesuch_project` if there are no candidates, or `e_ambiguous_project` if no single
 * candidate can be chosen.
 */
project_id select_project(const dependency_graph& g, std::string_view given);

/// Whether any direct dependency of `p` has a directory containing `needle`
bool needs(const dependency_graph& g, const project& p, std::string_view needle) noexcept;

/// Whether any direct dependent of `p` has a directory containing `needle`
bool is_needed_by(const dependency_graph& g, const project& p, std::string_view needle) noexcept;

}  // namespace pdg
