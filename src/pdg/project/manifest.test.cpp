#include "./manifest.hpp"

#include <pdg/pdg.test.hpp>
#include <pdg/temp.hpp>
#include <pdg/util/fs/io.hpp>

#include <catch2/catch.hpp>

using pdg::fs::path;
using paths = std::vector<path>;

TEST_CASE("Recognize path declarations") {
    struct case_ {
        std::string_view           line;
        std::optional<std::string> expect;
    };

    auto [line, expect] = GENERATE(Catch::Generators::values<case_>({
        {R"(config = { path = "../config" })", "../config"},
        {R"(config={path="../config"})", "../config"},
        {R"(  mux = { path = "../mux", version = "0.1" }  )", "../mux"},
        {"term = {\tpath\t=\t\"../term\" }", "../term"},
        {R"(a = { path = "../lua-api-crates/url-funcs" })", "../lua-api-crates/url-funcs"},
        {R"(a = { path = "sub_dir/x.y" })", "sub_dir/x.y"},
        // Only the last declaration on a line is seen
        {R"(a = { path = "../a" }, b = { path = "../b" })", "../b"},
        // Comments must begin the line
        {R"(# a = { path = "../a" })", std::nullopt},
        {R"(   #a = { path = "../a" })", std::nullopt},
        {R"(log = "0.4" # path = "../a")", "../a"},
        // Values outside of the recognized character set are not seen
        {R"(a = { path = "../Vendored" })", std::nullopt},
        {R"(a = { path = "../has space" })", "../hasspace"},
        {R"(a = { path = "C:\\dir" })", std::nullopt},
        {R"(a = { path = '../a' })", std::nullopt},
        {R"(log = "0.4")", std::nullopt},
        {R"(members = ["config", "mux"])", std::nullopt},
        {"", std::nullopt},
    }));

    INFO(line);
    CHECK(pdg::parse_path_dependency(line) == expect);
}

TEST_CASE("Line matching may fail with an exception") {
    // Matching allocates and logs, so allocation failures propagate to the caller
    STATIC_REQUIRE(!noexcept(pdg::parse_path_dependency(std::string_view{})));
}

TEST_CASE("Extract path dependencies from manifest text") {
    auto tmp = pdg::temporary_dir::create();
    pdg::fs::create_directories(tmp.path() / "app");
    pdg::fs::create_directories(tmp.path() / "lib");
    pdg::fs::create_directories(tmp.path() / "util/inner");
    pdg::write_file(tmp.path() / "file.txt", "");

    auto deps = pdg::extract_path_dependencies(R"(
[package]
name = "app"

[dependencies]
lib = { path = "../lib" }
inner = { path = "../util/./inner/" }
gone = { path = "../NoSuchDir" }
missing = { path = "../missing" }
file = { path = "../file.txt" }

[dev-dependencies]
lib = { path = "../lib" }
)",
                                               "app",
                                               tmp.path());
    CHECK(deps == paths{"lib", "util/inner", "lib"});
}

TEST_CASE("Extract dependencies of the root project") {
    auto tmp = pdg::temporary_dir::create();
    pdg::fs::create_directories(tmp.path() / "crates/core");

    auto deps = pdg::extract_path_dependencies("core = { path = \"crates/core\" }\r\n"
                                               "self = { path = \"\" }\n",
                                               ".",
                                               tmp.path());
    // An empty path names the manifest's own directory
    CHECK(deps == paths{"crates/core", "."});
}

TEST_CASE("Read the dependencies of a fixture manifest") {
    auto root = pdg::testing::DATA_DIR / "workspace";
    auto deps = REQUIRES_LEAF_NOFAIL(pdg::read_path_dependencies(root, "wezterm/Cargo.toml"));
    CHECK(deps == paths{"mux", "termwiz", "config"});

    deps = REQUIRES_LEAF_NOFAIL(pdg::read_path_dependencies(root, "term/Cargo.toml"));
    CHECK(deps == paths{"termwiz"});

    deps = REQUIRES_LEAF_NOFAIL(pdg::read_path_dependencies(root, "termwiz/Cargo.toml"));
    CHECK(deps == paths{"config"});
}
