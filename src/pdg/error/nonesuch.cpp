#include "./nonesuch.hpp"

#include <pdg/util/log.hpp>

#include <fansi/styled.hpp>

#include <iomanip>
#include <ostream>

using namespace fansi::literals;

void pdg::e_nonesuch::log_error(std::string_view fmt_str) const {
    pdg_log(error, fmt_str, given);
    if (nearest) {
        pdg_log(error, "  (Did you mean '.br.yellow[{}]'?)"_styled, *nearest);
    }
}

std::ostream& pdg::operator<<(std::ostream& out, const e_nonesuch& err) {
    out << "no such name " << std::quoted(err.given);
    if (err.nearest) {
        out << ", nearest is " << std::quoted(*err.nearest);
    }
    return out;
}
