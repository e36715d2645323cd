#pragma once

#include <pdg/util/fs/path.hpp>

#include <string>
#include <vector>

namespace pdg {

struct discover_options {
    /// The directory to search. Manifests are reported relative to this directory.
    fs::path root;
    /// The filename that marks a directory as a project
    std::string manifest_name = "Cargo.toml";
    /// Names of directories that are never descended into (e.g. "target")
    std::vector<std::string> exclude{};
};

/**
 * @brief Find every manifest file beneath (and including) the root directory.
 *
 * The walk is pre-order: a directory's own manifest precedes those of its subdirectories, and
 * subdirectories are visited in lexicographic order of their names, so the result is stable for an
 * unchanged tree. Symbolic links to directories are not followed.
 *
 * @return Paths of the manifests relative to `opts.root`, in walk order.
 *
 * File-system errors are thrown as std::system_error with an `e_scan_dir` attached.
 */
std::vector<fs::path> find_manifests(const discover_options& opts);

}  // namespace pdg
