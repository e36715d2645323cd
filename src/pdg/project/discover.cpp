#include "./discover.hpp"

#include "./error.hpp"

#include <pdg/error/on_error.hpp>
#include <pdg/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <algorithm>
#include <system_error>

using namespace pdg;

namespace {

[[noreturn]] void throw_scan_error(std::error_code ec) {
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, "Failed to scan directory"), ec);
}

struct manifest_walker {
    const discover_options& opts;
    std::vector<fs::path>   found{};

    bool is_excluded(const fs::path& name) const noexcept {
        return std::ranges::find(opts.exclude, name.string()) != opts.exclude.end();
    }

    void walk(path_ref reldir) {
        const auto dirpath = reldir == "." ? opts.root : opts.root / reldir;
        PDG_E_SCOPE(e_scan_dir{dirpath});

        std::vector<fs::directory_entry> entries;
        std::error_code                  ec;
        for (auto it = fs::directory_iterator{dirpath, ec}; !ec && it != fs::directory_iterator{};
             it.increment(ec)) {
            entries.push_back(*it);
        }
        if (ec) {
            throw_scan_error(ec);
        }
        std::ranges::sort(entries, std::less<>{}, [](const fs::directory_entry& e) {
            return e.path().filename();
        });

        std::vector<fs::path> subdirs;
        for (const auto& entry : entries) {
            auto name = entry.path().filename();
            auto st   = entry.symlink_status(ec);
            if (ec) {
                throw_scan_error(ec);
            }
            bool is_dir = fs::is_directory(st);
            if (fs::is_symlink(st)) {
                // A dangling link has no status, and is listed as a file
                std::error_code target_ec;
                is_dir = fs::is_directory(entry.status(target_ec));
            }
            if (!is_dir) {
                if (name == opts.manifest_name) {
                    auto manifest = normalize_path(reldir / name);
                    pdg_log(debug, "Found manifest [{}]", manifest.string());
                    found.push_back(std::move(manifest));
                }
            } else if (fs::is_symlink(st)) {
                pdg_log(trace, "Not following directory link [{}]", entry.path().string());
            } else if (is_excluded(name)) {
                pdg_log(trace, "Skipping excluded directory [{}]", entry.path().string());
            } else {
                subdirs.push_back(normalize_path(reldir / name));
            }
        }

        for (const auto& sub : subdirs) {
            walk(sub);
        }
    }
};

}  // namespace

std::vector<fs::path> pdg::find_manifests(const discover_options& opts) {
    manifest_walker walker{opts};
    walker.walk(".");
    pdg_log(debug,
            "Found {} '{}' manifest(s) beneath [{}]",
            walker.found.size(),
            opts.manifest_name,
            opts.root.string());
    return std::move(walker.found);
}
