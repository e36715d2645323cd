#pragma once

#include <functional>

namespace pdg {

/**
 * @brief Invoke `fn`, handling any error it raises: The error is logged, an error marker is
 * written, and an exit code is returned.
 *
 * Exit codes are 1 for a problem with the workspace or the requested project, and 42 for an
 * unexpected error.
 */
int handle_cli_errors(std::function<int()> fn) noexcept;

}  // namespace pdg
