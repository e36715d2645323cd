#pragma once

#include <string_view>

namespace pdg {

/**
 * @brief Write a short, stable identifier for a failure to the file named by the
 * PDG_WRITE_ERROR_MARKER environment variable, if it is set.
 */
void write_error_marker(std::string_view) noexcept;

}  // namespace pdg
