#include "./graph_common.hpp"

#include <pdg/report/report.hpp>

#include <iostream>

namespace pdg::cli::cmd {

int unused(const options& opts) {
    print_unused(std::cout, load_workspace_graph(opts));
    return 0;
}

}  // namespace pdg::cli::cmd
