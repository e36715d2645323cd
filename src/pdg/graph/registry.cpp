#include "./registry.hpp"

#include "./error.hpp"

#include <pdg/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>

using namespace pdg;

project_id project_registry::add_project(path_ref manifest_path) {
    auto dir = normalize_path(manifest_path.parent_path());
    auto id  = project_id{_projects.size()};
    auto did_insert = _by_dir.emplace(dir, id).second;
    if (!did_insert) {
        BOOST_LEAF_THROW_EXCEPTION(e_duplicate_project{dir});
    }
    _projects.push_back(project{
        .dir           = std::move(dir),
        .manifest_path = normalize_path(manifest_path),
    });
    return id;
}

void project_registry::link(project_id from, path_ref dep_dir) {
    neo_assert(expects, index_of(from) < _projects.size(), "Invalid project ID", index_of(from));
    auto to = find(dep_dir);
    if (!to) {
        BOOST_LEAF_THROW_EXCEPTION(e_unresolved_dependency{dep_dir});
    }
    auto& dependent = _projects[index_of(from)];
    auto& target    = _projects[index_of(*to)];
    pdg_log(trace, "Edge [{}] -> [{}]", dependent.dir.string(), target.dir.string());
    dependent.dependencies.push_back(*to);
    target.dependents.push_back(from);
}

std::optional<project_id> project_registry::find(path_ref dir) const noexcept {
    auto it = _by_dir.find(normalize_path(dir));
    if (it == _by_dir.end()) {
        return std::nullopt;
    }
    return it->second;
}
