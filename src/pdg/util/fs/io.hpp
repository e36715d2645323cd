#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace pdg {

/// The file that could not be read
struct e_read_file_path {
    std::filesystem::path value;
};

/// The file that could not be written
struct e_write_file_path {
    std::filesystem::path value;
};

/**
 * @brief Read the entire content of a file.
 *
 * Throws std::system_error carrying the errno of the failure, with `e_read_file_path` attached.
 */
[[nodiscard]] std::string read_file(const std::filesystem::path& path);

/// Create or truncate `path` and write `content` to it. Errors are thrown as for read_file()
void write_file(const std::filesystem::path& path, std::string_view content);

}  // namespace pdg
