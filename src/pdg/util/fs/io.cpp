#include "./io.hpp"

#include <pdg/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <cerrno>
#include <fstream>
#include <iterator>

using namespace pdg;

namespace {

[[noreturn]] void throw_io_error(int err, std::string_view what, const std::filesystem::path& p) {
    // Streams do not always set errno. Report a generic I/O error in that case.
    auto ec = std::error_code(err ? err : EIO, std::system_category());
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, neo::ufmt("{} [{}]", what, p.string())),
                               boost::leaf::e_errno{ec.value()},
                               ec);
}

}  // namespace

std::string pdg::read_file(const std::filesystem::path& path) {
    PDG_E_SCOPE(e_read_file_path{path});
    errno = 0;
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        throw_io_error(errno, "Failed to open file", path);
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw_io_error(errno, "Failed to read file", path);
    }
    return content;
}

void pdg::write_file(const std::filesystem::path& path, std::string_view content) {
    PDG_E_SCOPE(e_write_file_path{path});
    errno = 0;
    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    if (!out) {
        throw_io_error(errno, "Failed to open file for writing", path);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw_io_error(errno, "Failed to write file", path);
    }
}
