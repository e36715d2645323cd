#include "./graph_common.hpp"

#include <pdg/report/report.hpp>

#include <iostream>

namespace pdg::cli::cmd {

int ls(const options& opts) {
    auto g = load_workspace_graph(opts);
    print_listing(std::cout,
                  g,
                  listing_filter{
                      .needs     = opts.ls.needs,
                      .needed_by = opts.ls.needed_by,
                  });
    return 0;
}

}  // namespace pdg::cli::cmd
