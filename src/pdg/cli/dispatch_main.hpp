#pragma once

namespace pdg::cli {

struct options;

/**
 * @brief Run the subcommand selected in `opts`, returning the process exit code.
 */
int dispatch_main(const options& opts) noexcept;

}  // namespace pdg::cli
