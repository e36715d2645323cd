#pragma once

#include <pdg/project/discover.hpp>
#include <pdg/util/log.hpp>

#include <debate/argument_parser.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pdg::cli {

namespace fs = std::filesystem;

/**
 * @brief Top-level pdg subcommands
 */
enum class subcommand {
    _none_,
    report,
    unused,
    single,
    tree,
    ls,
};

/**
 * @brief Complete aggregate of all pdg command-line options
 */
struct options {
    using path       = fs::path;
    using string     = std::string;
    using opt_string = std::optional<std::string>;

    // The `--log-level` argument
    log::level log_level = default_log_level();

    // The `--workspace` argument: The directory that is searched for projects
    path workspace = default_workspace();
    // The `--manifest-name` argument
    string manifest_name = default_from_env("PDG_MANIFEST_NAME", "Cargo.toml");
    // All `--exclude` arguments
    std::vector<string> exclude;

    // The selected subcommand
    enum subcommand subcommand = cli::subcommand::_none_;

    // The project named for 'pdg report' and 'pdg tree'
    string root_project;

    /**
     * @brief Parameters specific to 'pdg ls'
     */
    struct {
        /// Only list projects with a direct dependency containing this string
        opt_string needs;
        /// Only list projects with a direct dependent containing this string
        opt_string needed_by;
    } ls;

    /// The project discovery parameters named by these options
    discover_options discovery() const;

    /**
     * @brief Attach arguments and subcommands to the given argument parser, binding those arguments
     * to the values in this object.
     */
    void setup_parser(debate::argument_parser& parser);

    static string     default_from_env(string env_var, string default_value) noexcept;
    static log::level default_log_level() noexcept;
    static path       default_workspace() noexcept;
};

}  // namespace pdg::cli
