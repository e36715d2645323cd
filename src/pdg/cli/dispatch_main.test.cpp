#include "./dispatch_main.hpp"

#include "./options.hpp"

#include <pdg/pdg.test.hpp>
#include <pdg/temp.hpp>
#include <pdg/util/fs/io.hpp>

#include <catch2/catch.hpp>

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace {

/// Redirect std::cout into a string for the lifetime of the object
struct cout_capture {
    std::ostringstream buf;
    std::streambuf*    prev = std::cout.rdbuf(buf.rdbuf());

    ~cout_capture() { std::cout.rdbuf(prev); }

    std::string str() const { return buf.str(); }
};

struct run_result {
    int         retc;
    std::string out;
};

run_result run(std::string_view fixture, pdg::cli::subcommand cmd, std::string root = "") {
    pdg::cli::options opts;
    opts.workspace    = pdg::testing::DATA_DIR / fixture;
    opts.subcommand   = cmd;
    opts.root_project = root;
    cout_capture cap;
    auto         rc = pdg::cli::dispatch_main(opts);
    return {rc, cap.str()};
}

}  // namespace

TEST_CASE("Run subcommands against fixture workspaces") {
    auto tmp    = pdg::temporary_dir::create();
    auto marker = tmp.path() / "marker.txt";
    ::setenv("PDG_WRITE_ERROR_MARKER", marker.c_str(), 1);

    using pdg::cli::subcommand;

    SECTION("The full report on a chain") {
        auto res = run("chain", subcommand::report, "app");
        CHECK(res.retc == 0);
        CHECK(res.out
              == "[unneeded]\n"
                 "* app\n"
                 "[needed by only 1]\n"
                 "[1] leaf ['middle']\n"
                 "[1] middle ['app']\n"
                 "* app\n"
                 "  * middle\n"
                 "    * leaf\n");
        CHECK_FALSE(pdg::fs::exists(marker));
    }

    SECTION("The dependency tree of a project in a larger workspace") {
        auto res = run("workspace", subcommand::tree, "term");
        CHECK(res.retc == 0);
        CHECK(res.out
              == "* term\n"
                 "  * termwiz\n"
                 "    * config\n");
    }

    SECTION("Single reports") {
        CHECK(run("chain", subcommand::unused).out == "[unneeded]\n* app\n");
        CHECK(run("chain", subcommand::single).out
              == "[needed by only 1]\n"
                 "[1] leaf ['middle']\n"
                 "[1] middle ['app']\n");
        CHECK(run("chain", subcommand::ls).out
              == "app -> ['middle']\n"
                 "leaf -> []\n"
                 "middle -> ['leaf']\n");
    }

    SECTION("A dependency directory without a manifest prints no report") {
        auto res = run("missing-manifest", subcommand::report, "app");
        CHECK(res.retc == 1);
        CHECK(res.out.empty());
        CHECK(pdg::read_file(marker) == "unresolved-dependency");
    }

    SECTION("A cycle below the root prints no report") {
        auto res = run("cycle", subcommand::report, "a");
        CHECK(res.retc == 1);
        CHECK(res.out.empty());
        CHECK(pdg::read_file(marker) == "dependency-cycle");
    }

    SECTION("Scans of a cyclic workspace still succeed") {
        auto res = run("cycle", subcommand::unused);
        CHECK(res.retc == 0);
        CHECK(res.out == "[unneeded]\n");
    }

    SECTION("An unknown root project") {
        auto res = run("chain", subcommand::tree, "nothing-like-it");
        CHECK(res.retc == 1);
        CHECK(res.out.empty());
        CHECK(pdg::read_file(marker) == "no-such-project");
    }

    SECTION("A workspace that does not exist") {
        auto res = run("no-such-workspace", subcommand::unused);
        CHECK(res.retc == 1);
        CHECK(res.out.empty());
        CHECK(pdg::read_file(marker) == "no-such-workspace");
    }

    ::unsetenv("PDG_WRITE_ERROR_MARKER");
}
