#include <pdg/cli/dispatch_main.hpp>
#include <pdg/cli/options.hpp>
#include <pdg/dym.hpp>
#include <pdg/util/log.hpp>

#include <debate/debate.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fansi/styled.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

using namespace fansi::literals;

namespace {

std::vector<std::string> subcommand_names(const debate::argument_parser& parser) {
    std::vector<std::string> names;
    if (parser.subcommands()) {
        for (auto& sub : parser.subcommands()->parsers) {
            names.push_back(sub.name());
        }
    }
    return names;
}

/// Print the usage of the parser that rejected the command line, followed by what went wrong
int usage_error(std::string_view                progname,
                const debate::argument_parser& parser,
                std::string_view                message) {
    fmt::print(stderr, "{}\n", parser.usage_string(progname));
    fmt::print(stderr, fmt::runtime(".bold.red[error:] {}\n"_styled), message);
    return 2;
}

/**
 * Run the parser over the command line. Returns an exit code if pdg should stop without running a
 * report: After printing help, or after a command-line error.
 */
std::optional<int> parse_command_line(std::string_view                progname,
                                      const debate::argument_parser&  parser,
                                      const std::vector<std::string>& args) {
    return boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            parser.parse_argv(args);
            return std::nullopt;
        },
        [&](debate::help_request, debate::e_argument_parser p) {
            fmt::print("{}", p.value.help_string(progname));
            return 0;
        },
        [&](debate::unrecognized_argument,
            debate::e_argument_parser p,
            debate::e_arg_spelling    word) {
            auto rc = usage_error(progname,
                                  p.value,
                                  fmt::format("'{}' is not an option or report name", word.value));
            if (word.value.starts_with("-")) {
                return rc;
            }
            if (auto nearest = pdg::did_you_mean(word.value, subcommand_names(p.value))) {
                fmt::print(stderr,
                           fmt::runtime("  (Did you mean '.br.yellow[{}]'?)\n"_styled),
                           *nearest);
            }
            return rc;
        },
        [&](debate::invalid_arguments,
            debate::e_argument_parser   p,
            debate::e_arg_spelling      spell,
            debate::e_invalid_arg_value val) {
            auto msg = fmt::format("'{}' is not a valid value for {}", val.value, spell.value);
            return usage_error(progname, p.value, msg);
        },
        [&](debate::missing_value, debate::e_argument_parser p, debate::e_arg_spelling spell) {
            return usage_error(progname, p.value, fmt::format("{} requires a value", spell.value));
        },
        [&](debate::invalid_repetition, debate::e_argument_parser p, debate::e_arg_spelling spell) {
            return usage_error(progname,
                               p.value,
                               fmt::format("{} may only be given once", spell.value));
        },
        [&](debate::missing_required, debate::e_argument_parser p, debate::e_argument arg) {
            auto msg = fmt::format("Missing the {} argument", arg.value.preferred_spelling());
            return usage_error(progname, p.value, msg);
        },
        [&](debate::missing_required, debate::e_argument_parser p) {
            return usage_error(progname,
                               p.value,
                               fmt::format("Name a report to print: {}",
                                           fmt::join(subcommand_names(p.value), ", ")));
        },
        [&](const debate::invalid_arguments& err, debate::e_argument_parser p) {
            return usage_error(progname, p.value, err.what());
        });
}

}  // namespace

int main(int argc, char** argv) {
    pdg::log::init_logger();

    std::string_view         progname = argv[0];
    std::vector<std::string> args{argv + 1, argv + argc};

    pdg::cli::options       opts;
    debate::argument_parser parser{
        "Audit the local path dependencies between the projects of a workspace"};
    opts.setup_parser(parser);

    if (auto rc = parse_command_line(progname, parser, args)) {
        return *rc;
    }
    pdg::log::current_log_level = opts.log_level;
    return pdg::cli::dispatch_main(opts);
}
