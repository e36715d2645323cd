#include "./graph_common.hpp"

#include <pdg/graph/query.hpp>
#include <pdg/report/report.hpp>

#include <iostream>
#include <sstream>

namespace pdg::cli::cmd {

int report(const options& opts) {
    auto g    = load_workspace_graph(opts);
    auto root = select_project(g, opts.root_project);
    // Nothing is printed unless every section can be rendered
    std::ostringstream out;
    print_unused(out, g);
    print_single_consumer(out, g);
    print_tree(out, g, root);
    std::cout << out.str();
    return 0;
}

}  // namespace pdg::cli::cmd
