#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <pdg/error/on_error.hpp>

#include <neo/assert.hpp>

using namespace pdg;

namespace pdg::cli {

namespace cmd {
using command = int(const options&);

command report;
command unused;
command single;
command tree;
command ls;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return pdg::handle_cli_errors([&] {
        PDG_E_SCOPE(opts.subcommand);
        switch (opts.subcommand) {
        case subcommand::report:
            return cmd::report(opts);
        case subcommand::unused:
            return cmd::unused(opts);
        case subcommand::single:
            return cmd::single(opts);
        case subcommand::tree:
            return cmd::tree(opts);
        case subcommand::ls:
            return cmd::ls(opts);
        case subcommand::_none_:;
        }
        neo::unreachable();
    });
}

}  // namespace pdg::cli
