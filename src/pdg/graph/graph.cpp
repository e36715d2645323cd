#include "./graph.hpp"

#include "./error.hpp"

#include <pdg/error/on_error.hpp>
#include <pdg/project/error.hpp>
#include <pdg/project/manifest.hpp>
#include <pdg/util/log.hpp>

using namespace pdg;

std::optional<project_id> dependency_graph::find(path_ref dir) const noexcept {
    auto it = _by_dir.find(normalize_path(dir));
    if (it == _by_dir.end()) {
        return std::nullopt;
    }
    return it->second;
}

dependency_graph pdg::build_graph(const discover_options& opts) {
    project_registry reg;
    for (auto& manifest : find_manifests(opts)) {
        reg.add_project(manifest);
    }

    for (std::size_t idx = 0; idx < reg.size(); ++idx) {
        const auto  id   = project_id{idx};
        const auto& proj = reg[id];
        PDG_E_SCOPE(e_dependent_project{proj.dir});
        PDG_E_SCOPE(e_manifest_path{proj.manifest_path});
        for (auto& dep : read_path_dependencies(opts.root, proj.manifest_path)) {
            reg.link(id, dep);
        }
    }

    pdg_log(debug, "Linked {} project(s)", reg.size());
    return dependency_graph{std::move(reg)};
}
