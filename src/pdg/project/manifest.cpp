#include "./manifest.hpp"

#include "./error.hpp"

#include <pdg/error/on_error.hpp>
#include <pdg/util/fs/io.hpp>
#include <pdg/util/log.hpp>

#include <ctre.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

using namespace pdg;

namespace {

bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string_view strip(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

std::optional<std::string> pdg::parse_path_dependency(std::string_view line_) {
    auto line = strip(line_);
    if (line.starts_with("#")) {
        return std::nullopt;
    }
    std::string compact;
    std::ranges::copy_if(line, std::back_inserter(compact), [](char c) { return !is_space(c); });
    if (compact.find("path=") == compact.npos) {
        return std::nullopt;
    }

    // The leading '.*' is greedy: The last declaration on the line wins
    constexpr ctll::fixed_string path_decl_re = R"(.*path="([a-z0-9_/.\-]*)".*)";

    auto mat = ctre::match<path_decl_re>(compact);
    if (!mat) {
        pdg_log(trace, "Line [{}] mentions a path, but does not match a path declaration", line);
        return std::nullopt;
    }
    return mat.get<1>().to_string();
}

std::vector<fs::path> pdg::extract_path_dependencies(std::string_view text,
                                                     path_ref         manifest_dir,
                                                     path_ref         scan_root) {
    std::vector<fs::path> ret;
    while (!text.empty()) {
        auto nl_pos = text.find('\n');
        auto line   = text.substr(0, nl_pos);
        text        = nl_pos == text.npos ? std::string_view{} : text.substr(nl_pos + 1);

        auto declared = parse_path_dependency(line);
        if (!declared) {
            continue;
        }
        auto resolved = normalize_path(manifest_dir / *declared);
        auto on_disk  = resolved.is_absolute() ? resolved : scan_root / resolved;

        std::error_code ec;
        if (!fs::is_directory(on_disk, ec)) {
            pdg_log(trace,
                    "Ignoring path dependency [{}] of [{}]: [{}] is not a directory",
                    *declared,
                    manifest_dir.string(),
                    on_disk.string());
            continue;
        }
        ret.push_back(std::move(resolved));
    }
    return ret;
}

std::vector<fs::path> pdg::read_path_dependencies(path_ref scan_root, path_ref manifest_path) {
    PDG_E_SCOPE(e_manifest_path{manifest_path});
    auto content = pdg::read_file(scan_root / manifest_path);
    return extract_path_dependencies(content,
                                     normalize_path(manifest_path.parent_path()),
                                     scan_root);
}
