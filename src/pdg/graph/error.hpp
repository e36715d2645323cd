#pragma once

#include <pdg/error/nonesuch.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace pdg {

/// A declared path dependency that names an existing directory without a manifest
struct e_unresolved_dependency {
    std::filesystem::path value;
};

/// The directory of the project that declared the dependency being processed
struct e_dependent_project {
    std::filesystem::path value;
};

/// A directory that was found to hold more than one project
struct e_duplicate_project {
    std::filesystem::path value;
};

/// No project matches the requested name
struct e_nonesuch_project : e_nonesuch {
    using e_nonesuch::e_nonesuch;
};

/// More than one project matches the requested name
struct e_ambiguous_project {
    std::string              given;
    std::vector<std::string> candidates;
};

/// The chain of project directories forming a cycle, starting and ending with the same project
struct e_dependency_cycle {
    std::vector<std::filesystem::path> value;
};

}  // namespace pdg
