#include "./path.hpp"

#include <pdg/error/result.hpp>
#include <pdg/pdg.test.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <catch2/catch.hpp>

TEST_CASE("Normalize some paths") {
    CHECK(pdg::normalize_path("foo").string() == "foo");
    CHECK(pdg::normalize_path("foo/bar").string() == "foo/bar");
    CHECK(pdg::normalize_path("foo/bar/").string() == "foo/bar");
    CHECK(pdg::normalize_path("foo//bar/").string() == "foo/bar");
    CHECK(pdg::normalize_path("foo/./bar/").string() == "foo/bar");
    CHECK(pdg::normalize_path("foo/../foo/bar/").string() == "foo/bar");
}

TEST_CASE("Normalization collapses relative components the way manifests spell them") {
    CHECK(pdg::normalize_path("./term").string() == "term");
    CHECK(pdg::normalize_path("term/../config").string() == "config");
    CHECK(pdg::normalize_path("term/..").string() == ".");
    CHECK(pdg::normalize_path("lua-api-crates/battery/../../wezterm").string() == "wezterm");
    CHECK(pdg::normalize_path("env-bootstrap/../../outside").string() == "../outside");
    CHECK(pdg::normalize_path("").string() == ".");
    CHECK(pdg::normalize_path("/").string() == "/");
}

TEST_CASE("Resolve an existing directory") {
    auto resolved
        = REQUIRES_LEAF_NOFAIL(pdg::resolve_path_strong(pdg::testing::DATA_DIR / "chain/./app/.."));
    CHECK(resolved == pdg::testing::DATA_DIR / "chain");
}

TEST_CASE("Resolving a missing path reports it") {
    auto missing = pdg::testing::DATA_DIR / "no-such-workspace";
    boost::leaf::try_handle_all(
        [&]() -> pdg::result<void> {
            BOOST_LEAF_CHECK(pdg::resolve_path_strong(missing));
            FAIL("Expected resolution to fail");
            return {};
        },
        [&](pdg::e_resolve_path path, std::error_code ec) {
            CHECK(path.value == missing);
            CHECK(ec == std::errc::no_such_file_or_directory);
        },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });
}
