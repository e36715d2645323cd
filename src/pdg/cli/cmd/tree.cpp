#include "./graph_common.hpp"

#include <pdg/graph/query.hpp>
#include <pdg/report/report.hpp>
#include <pdg/util/log.hpp>

#include <iostream>

namespace pdg::cli::cmd {

int tree(const options& opts) {
    auto g    = load_workspace_graph(opts);
    auto root = select_project(g, opts.root_project);
    pdg_log(debug, "Printing the dependency tree of [{}]", g[root].dir.string());
    print_tree(std::cout, g, root);
    return 0;
}

}  // namespace pdg::cli::cmd
