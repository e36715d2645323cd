#include "./error_handler.hpp"

#include <pdg/error/marker.hpp>
#include <pdg/graph/error.hpp>
#include <pdg/project/error.hpp>
#include <pdg/util/fs/io.hpp>
#include <pdg/util/fs/path.hpp>
#include <pdg/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fansi/styled.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include <system_error>

using namespace pdg;
using namespace fansi::literals;

template <>
struct fmt::formatter<boost::leaf::verbose_diagnostic_info> : fmt::ostream_formatter {};

namespace {

auto handlers = std::tuple(  //
    [](e_unresolved_dependency dep, e_dependent_project proj, e_manifest_path* manifest) {
        pdg_log(error,
                "Project [.bold.yellow[{}]] depends on [.bold.red[{}]], which is not a "
                "project"_styled,
                proj.value.string(),
                dep.value.string());
        if (manifest) {
            pdg_log(error,
                    "  (Declared in [.bold.yellow[{}]], but no manifest was found in [{}])"_styled,
                    manifest->value.string(),
                    dep.value.string());
        }
        write_error_marker("unresolved-dependency");
        return 1;
    },
    [](e_duplicate_project dup) {
        pdg_log(error,
                "More than one manifest was found for the project in [.bold.red[{}]]"_styled,
                dup.value.string());
        write_error_marker("duplicate-project");
        return 1;
    },
    [](e_dependency_cycle cycle) {
        std::vector<std::string> dirs;
        for (auto& dir : cycle.value) {
            dirs.push_back(dir.string());
        }
        pdg_log(error,
                "The dependency tree cannot be printed, because it contains a cycle: "
                ".bold.red[{}]"_styled,
                fmt::join(dirs, " -> "));
        write_error_marker("dependency-cycle");
        return 1;
    },
    [](e_nonesuch_project nonesuch) {
        nonesuch.log_error("No project matches '.bold.red[{}]'"_styled);
        write_error_marker("no-such-project");
        return 1;
    },
    [](e_ambiguous_project amb) {
        pdg_log(error,
                "The name '.bold.red[{}]' matches more than one project:"_styled,
                amb.given);
        for (auto& cand : amb.candidates) {
            pdg_log(error, "  - .bold.yellow[{}]"_styled, cand);
        }
        write_error_marker("ambiguous-project");
        return 1;
    },
    [](e_resolve_path path, std::error_code ec) {
        pdg_log(error,
                "Cannot open workspace [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                path.value.string(),
                ec.message());
        write_error_marker("no-such-workspace");
        return 1;
    },
    [](const std::system_error& err, e_scan_dir dir) {
        pdg_log(error,
                "Failed to search directory [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                dir.value.string(),
                err.code().message());
        write_error_marker("scan-failed");
        return 1;
    },
    [](const std::system_error& err, e_manifest_path manifest, e_dependent_project* proj) {
        pdg_log(error,
                "Failed to read manifest [.bold.yellow[{}]]: .bold.red[{}]"_styled,
                manifest.value.string(),
                err.code().message());
        if (proj) {
            pdg_log(error, "  (While loading project [{}])", proj->value.string());
        }
        write_error_marker("manifest-read-failed");
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        pdg_log(
            critical,
            "An unhandled std::system_error arose. .bold.red[THIS IS A PDG BUG!] Info: {}"_styled,
            diag);
        pdg_log(critical,
                "Exception message from std::system_error: .bold.red[{}]"_styled,
                exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        pdg_log(critical,
                "An unhandled error arose. .bold.red[THIS IS A PDG BUG!] Info: {}"_styled,
                diag);
        return 42;
    });

}  // namespace

int pdg::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
