#include "./options.hpp"

#include <pdg/util/env.hpp>

#include <debate/argument_parser.hpp>

#include <magic_enum.hpp>

using namespace pdg;
using namespace debate;

namespace {

struct setup {
    pdg::cli::options& opts;

    // Both 'report' and 'tree' take the root project as their positional argument
    argument root_project_arg() const {
        return argument{
            .help = "The project at the root of the tree. Either its directory relative to the "
                    "workspace, or a unique part of that directory",
            .valname  = "<root-project>",
            .required = true,
            .action   = put_into(opts.root_project),
        };
    }

    void add_global_options(argument_parser& parser) {
        parser.add_argument({
            .long_spellings  = {"log-level"},
            .short_spellings = {"l"},
            .help            = "Set the pdg logging level. One of 'trace', 'debug', 'info', \n"
                               "'warn', 'error', 'critical', or 'silent'",
            .valname         = "<level>",
            .action          = put_into(opts.log_level),
        });
        parser.add_argument({
            .long_spellings  = {"workspace"},
            .short_spellings = {"w"},
            .help = "The directory to search for projects. Defaults to $PDG_WORKSPACE, or the "
                    "current directory",
            .valname = "<directory>",
            .action  = put_into(opts.workspace),
        });
        parser.add_argument({
            .long_spellings  = {"manifest-name"},
            .short_spellings = {"m"},
            .help = "The filename of project manifests. Defaults to $PDG_MANIFEST_NAME, or "
                    "'Cargo.toml'",
            .valname = "<filename>",
            .action  = put_into(opts.manifest_name),
        });
        parser.add_argument({
            .long_spellings  = {"exclude"},
            .short_spellings = {"x"},
            .help            = "Do not search directories with this name (e.g. 'target'). May be "
                               "given more than once",
            .valname         = "<dirname>",
            .can_repeat      = true,
            .action          = push_back_onto(opts.exclude),
        });
    }

    void add_subcommands(argument_parser& parser) {
        parser.set_subcommands("The report to print", put_into(opts.subcommand));
        parser
            .add_subcommand("report",
                            "Print the unneeded and single-consumer projects, and the dependency "
                            "tree of a project")
            .add_argument(root_project_arg());
        parser.add_subcommand("unused", "Print the projects that no other project depends on");
        parser.add_subcommand("single",
                              "Print the projects that exactly one other project depends on");
        parser.add_subcommand("tree", "Print the dependency tree of a project")
            .add_argument(root_project_arg());

        auto& ls_cmd
            = parser.add_subcommand("ls", "List every project with its direct dependencies");
        ls_cmd.add_argument({
            .long_spellings = {"needs"},
            .help           = "Only list projects with a direct dependency whose directory "
                              "contains the given string",
            .valname        = "<string>",
            .action         = put_into(opts.ls.needs),
        });
        ls_cmd.add_argument({
            .long_spellings = {"needed-by"},
            .help           = "Only list projects with a direct dependent whose directory "
                              "contains the given string",
            .valname        = "<string>",
            .action         = put_into(opts.ls.needed_by),
        });
    }
};

}  // namespace

void cli::options::setup_parser(debate::argument_parser& parser) {
    setup s{*this};
    s.add_global_options(parser);
    s.add_subcommands(parser);
}

discover_options cli::options::discovery() const {
    return discover_options{
        .root          = workspace,
        .manifest_name = manifest_name,
        .exclude       = exclude,
    };
}

std::string cli::options::default_from_env(std::string key, std::string def) noexcept {
    return pdg::getenv(key).value_or(def);
}

log::level cli::options::default_log_level() noexcept {
    auto env = pdg::getenv("PDG_LOG_LEVEL");
    if (!env) {
        return log::level::info;
    }
    return magic_enum::enum_cast<log::level>(*env).value_or(log::level::info);
}

fs::path cli::options::default_workspace() noexcept {
    return pdg::getenv("PDG_WORKSPACE", [] {
        std::error_code ec;
        auto            cwd = fs::current_path(ec);
        return ec ? std::string(".") : cwd.string();
    });
}
