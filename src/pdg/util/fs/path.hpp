#pragma once

#include <pdg/error/result_fwd.hpp>

#include <filesystem>

namespace pdg {

namespace fs = std::filesystem;

using path_ref = const fs::path&;

/// The path that could not be resolved against the filesystem
struct e_resolve_path {
    fs::path value;
};

/**
 * @brief Lexically normalize a path. This is the form used for project keys.
 *
 * Dot and dot-dot elements are folded away and a trailing separator is dropped, so two spellings
 * of the same location relative to one base compare equal. The filesystem is not consulted. An
 * empty result is spelled ".".
 */
[[nodiscard]] fs::path normalize_path(path_ref p) noexcept;

/// Canonicalize a path that must exist. Fails with `e_resolve_path` and the system error code
/// otherwise.
[[nodiscard]] result<fs::path> resolve_path_strong(path_ref p) noexcept;

}  // namespace pdg
