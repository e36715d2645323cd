#include "./temp.hpp"

#include <boost/leaf/exception.hpp>

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <utility>

using namespace pdg;

temporary_dir temporary_dir::create() {
    auto parent       = fs::temp_directory_path();
    auto dir_template = (parent / "pdg-tmp-XXXXXX").string();
    if (::mkdtemp(dir_template.data()) == nullptr) {
        auto ec = std::error_code(errno, std::system_category());
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, "Failed to create a temporary directory"),
                                   e_resolve_path{parent});
    }
    return temporary_dir{fs::path(dir_template)};
}

temporary_dir::temporary_dir(temporary_dir&& other) noexcept
    : _path(std::exchange(other._path, fs::path())) {}

temporary_dir::~temporary_dir() {
    if (_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(_path, ec);
}
