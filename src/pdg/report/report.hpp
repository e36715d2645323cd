#pragma once

#include <pdg/graph/query.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace pdg {

/// Print the `[unneeded]` section: One `* <dir>` line for each unused project
void print_unused(std::ostream& out, const dependency_graph& g);

/// Print the `[needed by only 1]` section: One `[1] <dir> ['<dependent>']` line for each project
void print_single_consumer(std::ostream& out, const dependency_graph& g);

/// Print the dependency tree of `root`, one `* <dir>` line per entry, indented two spaces per level
void print_tree(std::ostream& out, const dependency_graph& g, project_id root);

struct listing_filter {
    std::optional<std::string> needs{};
    std::optional<std::string> needed_by{};
};

/// Print `<dir> -> [<dep>, ...]` for each project accepted by the filter
void print_listing(std::ostream& out, const dependency_graph& g, const listing_filter& filter);

}  // namespace pdg
