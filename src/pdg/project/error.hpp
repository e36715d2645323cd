#pragma once

#include <filesystem>

namespace pdg {

/// A directory that was being enumerated while searching for manifests
struct e_scan_dir {
    std::filesystem::path value;
};

/// The manifest file of the project being processed
struct e_manifest_path {
    std::filesystem::path value;
};

}  // namespace pdg
