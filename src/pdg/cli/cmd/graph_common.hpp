#pragma once

#include "../options.hpp"

#include <pdg/graph/graph.hpp>

namespace pdg::cli {

/// Discover and link the projects of the workspace named by `opts`
dependency_graph load_workspace_graph(const options& opts);

}  // namespace pdg::cli
