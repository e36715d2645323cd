#include "./graph_common.hpp"

#include <pdg/error/result.hpp>
#include <pdg/util/fs/path.hpp>
#include <pdg/util/log.hpp>

pdg::dependency_graph pdg::cli::load_workspace_graph(const options& opts) {
    auto discovery = opts.discovery();
    discovery.root = resolve_path_strong(discovery.root).value();
    pdg_log(debug,
            "Searching for '{}' manifests in [{}]",
            discovery.manifest_name,
            discovery.root.string());
    return build_graph(discovery);
}
