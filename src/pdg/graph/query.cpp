#include "./query.hpp"

#include "./error.hpp"

#include <pdg/dym.hpp>
#include <pdg/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <algorithm>
#include <ranges>

using namespace pdg;

namespace {

bool dir_contains(const project& p, std::string_view needle) noexcept {
    return p.dir.string().find(needle) != std::string::npos;
}

struct tree_walker {
    const dependency_graph& graph;

    std::vector<tree_entry> entries{};
    // The projects currently being walked, outermost first
    std::vector<project_id> chain{};

    void walk(project_id id) {
        auto cycle_start = std::ranges::find(chain, id);
        if (cycle_start != chain.end()) {
            std::vector<fs::path> cycle;
            for (auto it = cycle_start; it != chain.end(); ++it) {
                cycle.push_back(graph[*it].dir);
            }
            cycle.push_back(graph[id].dir);
            BOOST_LEAF_THROW_EXCEPTION(e_dependency_cycle{std::move(cycle)});
        }
        entries.push_back(tree_entry{static_cast<int>(chain.size()), id});
        chain.push_back(id);
        for (auto dep : graph[id].dependencies) {
            walk(dep);
        }
        chain.pop_back();
    }
};

}  // namespace

std::vector<project_id> pdg::unused_projects(const dependency_graph& g) {
    std::vector<project_id> ret;
    for (auto& p : g.projects()) {
        if (p.dependents.empty()) {
            ret.push_back(g.id_of(p));
        }
    }
    return ret;
}

std::vector<single_consumer> pdg::single_consumer_projects(const dependency_graph& g) {
    std::vector<single_consumer> ret;
    for (auto& p : g.projects()) {
        if (p.dependents.size() == 1) {
            ret.push_back(single_consumer{g.id_of(p), p.dependents.front()});
        }
    }
    return ret;
}

std::vector<tree_entry> pdg::dependency_tree(const dependency_graph& g, project_id root) {
    tree_walker walker{g};
    walker.walk(root);
    return std::move(walker.entries);
}

project_id pdg::select_project(const dependency_graph& g, std::string_view given) {
    if (auto exact = g.find(fs::path(given))) {
        return *exact;
    }

    std::vector<project_id> candidates;
    for (auto& p : g.projects()) {
        if (dir_contains(p, given)) {
            candidates.push_back(g.id_of(p));
        }
    }
    if (candidates.size() == 1) {
        pdg_log(debug, "Selected project [{}] for '{}'", g[candidates[0]].dir.string(), given);
        return candidates.front();
    }

    if (candidates.empty()) {
        std::vector<std::string> all_dirs;
        for (auto& p : g.projects()) {
            all_dirs.push_back(p.dir.string());
        }
        BOOST_LEAF_THROW_EXCEPTION(e_nonesuch_project{given, did_you_mean(given, all_dirs)});
    }

    std::vector<project_id> named;
    std::ranges::copy_if(candidates, std::back_inserter(named), [&](project_id id) {
        return g[id].dir.filename().string() == given;
    });
    if (named.size() == 1) {
        pdg_log(debug, "Selected project [{}] for '{}'", g[named[0]].dir.string(), given);
        return named.front();
    }

    std::vector<std::string> names;
    for (auto id : candidates) {
        names.push_back(g[id].dir.string());
    }
    BOOST_LEAF_THROW_EXCEPTION(e_ambiguous_project{std::string(given), std::move(names)});
}

bool pdg::needs(const dependency_graph& g, const project& p, std::string_view needle) noexcept {
    return std::ranges::any_of(p.dependencies,
                               [&](project_id id) { return dir_contains(g[id], needle); });
}

bool pdg::is_needed_by(const dependency_graph& g,
                       const project&          p,
                       std::string_view        needle) noexcept {
    return std::ranges::any_of(p.dependents,
                               [&](project_id id) { return dir_contains(g[id], needle); });
}
