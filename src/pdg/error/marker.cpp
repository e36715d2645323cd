#include "./marker.hpp"

#include <pdg/util/env.hpp>
#include <pdg/util/fs/io.hpp>
#include <pdg/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>

#include <system_error>

void pdg::write_error_marker(std::string_view error) noexcept {
    pdg_log(trace, "[error marker {}]", error);
    auto marker_path = pdg::getenv("PDG_WRITE_ERROR_MARKER");
    if (!marker_path) {
        return;
    }
    // A marker that cannot be written must not hide the error being reported
    boost::leaf::try_catch(
        [&] {
            pdg::write_file(*marker_path, error);
            pdg_log(trace, "[error marker written to [{}]]", *marker_path);
        },
        [&](const std::system_error& e) {
            pdg_log(warn, "Failed to write error marker file [{}]: {}", *marker_path, e.what());
        },
        [&] { pdg_log(warn, "Failed to write error marker file [{}]", *marker_path); });
}
