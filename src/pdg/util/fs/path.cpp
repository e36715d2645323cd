#include "./path.hpp"

#include <pdg/error/result.hpp>

using namespace pdg;

fs::path pdg::normalize_path(path_ref p_) noexcept {
    auto p = p_.lexically_normal();
    while (!p.empty() && p.filename().empty() && p != p.root_path()) {
        p = p.parent_path();
    }
    if (p.empty()) {
        return ".";
    }
    return p;
}

result<fs::path> pdg::resolve_path_strong(path_ref p_) noexcept {
    std::error_code ec;
    auto            p = fs::canonical(p_, ec);
    if (ec) {
        return new_error(ec, e_resolve_path{p_});
    }
    return normalize_path(p);
}
