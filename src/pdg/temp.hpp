#pragma once

#include <pdg/util/fs/path.hpp>

namespace pdg {

/// A fresh directory under the system's temporary directory, removed with all of its content
/// when the owning object is destroyed
class temporary_dir {
    fs::path _path;

    explicit temporary_dir(fs::path p) noexcept
        : _path(std::move(p)) {}

public:
    /// Throws std::system_error if no directory can be created
    [[nodiscard]] static temporary_dir create();

    temporary_dir(temporary_dir&& other) noexcept;
    temporary_dir& operator=(temporary_dir&&) = delete;
    ~temporary_dir();

    path_ref path() const noexcept { return _path; }
};

}  // namespace pdg
