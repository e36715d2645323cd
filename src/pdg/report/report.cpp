#include "./report.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <ostream>
#include <ranges>

using namespace pdg;

namespace {

/// Quote a list of directories the way they were originally shown: ['a', 'b']
std::string quoted_dirs(const dependency_graph& g, const std::vector<project_id>& ids) {
    std::vector<std::string> quoted;
    for (auto id : ids) {
        quoted.push_back(fmt::format("'{}'", g[id].dir.string()));
    }
    return fmt::format("[{}]", fmt::join(quoted, ", "));
}

}  // namespace

void pdg::print_unused(std::ostream& out, const dependency_graph& g) {
    fmt::print(out, "[unneeded]\n");
    for (auto id : unused_projects(g)) {
        fmt::print(out, "* {}\n", g[id].dir.string());
    }
}

void pdg::print_single_consumer(std::ostream& out, const dependency_graph& g) {
    fmt::print(out, "[needed by only 1]\n");
    for (auto [id, consumer] : single_consumer_projects(g)) {
        fmt::print(out, "[1] {} {}\n", g[id].dir.string(), quoted_dirs(g, {consumer}));
    }
}

void pdg::print_tree(std::ostream& out, const dependency_graph& g, project_id root) {
    // Collect the whole tree first so that a cycle produces no partial output
    auto entries = dependency_tree(g, root);
    for (auto& ent : entries) {
        fmt::print(out, "{:{}}* {}\n", "", ent.depth * 2, g[ent.project].dir.string());
    }
}

void pdg::print_listing(std::ostream&           out,
                        const dependency_graph& g,
                        const listing_filter&   filter) {
    for (auto& p : g.projects()) {
        if (filter.needs && !needs(g, p, *filter.needs)) {
            continue;
        }
        if (filter.needed_by && !is_needed_by(g, p, *filter.needed_by)) {
            continue;
        }
        fmt::print(out, "{} -> {}\n", p.dir.string(), quoted_dirs(g, p.dependencies));
    }
}
