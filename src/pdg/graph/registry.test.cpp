#include "./registry.hpp"

#include "./error.hpp"

#include <pdg/pdg.test.hpp>

#include <catch2/catch.hpp>

using pdg::project_id;

TEST_CASE("Projects are keyed by the directory of their manifest") {
    pdg::project_registry reg;
    auto                  root = reg.add_project("Cargo.toml");
    auto                  term = reg.add_project("term/Cargo.toml");
    auto                  deep = reg.add_project("./crates/../crates/deep/Cargo.toml");

    CHECK(reg.size() == 3);
    CHECK(reg[root].dir == ".");
    CHECK(reg[term].dir == "term");
    CHECK(reg[deep].dir == "crates/deep");
    CHECK(reg[deep].manifest_path == "crates/deep/Cargo.toml");

    CHECK(reg.find(".") == root);
    CHECK(reg.find("term/") == term);
    CHECK(reg.find("crates/deep") == deep);
    CHECK_FALSE(reg.find("crates").has_value());
}

TEST_CASE("Linking records both directions of an edge") {
    pdg::project_registry reg;
    auto                  app = reg.add_project("app/Cargo.toml");
    auto                  lib = reg.add_project("lib/Cargo.toml");

    reg.link(app, "lib");
    reg.link(app, "lib");
    CHECK(reg[app].dependencies == std::vector{lib, lib});
    CHECK(reg[lib].dependents == std::vector{app, app});
    CHECK(reg[app].dependents.empty());
    CHECK(reg[lib].dependencies.empty());
}

TEST_CASE("Linking to a directory that is not a project fails") {
    pdg::project_registry reg;
    auto                  app = reg.add_project("app/Cargo.toml");
    boost::leaf::try_catch(
        [&] {
            reg.link(app, "docs");
            FAIL("Expected an error");
        },
        [](pdg::e_unresolved_dependency dep) { CHECK(dep.value == "docs"); },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });
    CHECK(reg[app].dependencies.empty());
}

TEST_CASE("Two manifests may not share a directory") {
    pdg::project_registry reg;
    reg.add_project("app/Cargo.toml");
    boost::leaf::try_catch(
        [&] {
            reg.add_project("app/../app/Cargo.toml");
            FAIL("Expected an error");
        },
        [](pdg::e_duplicate_project dup) { CHECK(dup.value == "app"); },
        [](const boost::leaf::verbose_diagnostic_info& info) {
            FAIL("Unexpected error: " << info);
        });
}
