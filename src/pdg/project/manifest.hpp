#pragma once

#include <pdg/util/fs/path.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pdg {

/**
 * @brief Extract the value of a `path="..."` declaration from a single manifest line.
 *
 * This is a line-oriented, best-effort match and not a manifest parser:
 *
 * - The line is stripped, and a line beginning with `#` is a comment.
 * - All whitespace is removed before matching, so `dep = { path = "../x" }` is recognized.
 * - The value may only contain lowercase letters, digits, and `_ / . -`. A declaration using any
 *   other character (such as an uppercase letter) is not recognized.
 * - If a line holds more than one declaration, the last one is returned.
 *
 * @return The declared path, or nullopt if the line does not declare one.
 */
std::optional<std::string> parse_path_dependency(std::string_view line);

/**
 * @brief Find the local path dependencies declared by the text of a manifest.
 *
 * @param text The content of the manifest
 * @param manifest_dir The directory of the manifest, relative to `scan_root`
 * @param scan_root The directory against which relative paths are checked for existence
 *
 * @return One normalized directory (relative to `scan_root`) for each declaring line, in the
 * order of appearance. Declarations that do not resolve to an existing directory are dropped.
 */
std::vector<fs::path>
extract_path_dependencies(std::string_view text, path_ref manifest_dir, path_ref scan_root);

/**
 * @brief Read the manifest at `scan_root / manifest_path` and extract its path dependencies.
 *
 * Throws std::system_error if the manifest cannot be read.
 */
std::vector<fs::path> read_path_dependencies(path_ref scan_root, path_ref manifest_path);

}  // namespace pdg
