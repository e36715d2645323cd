#include "./debate.hpp"

#include <catch2/catch.hpp>

namespace {

enum class verbosity {
    quiet,
    normal,
    very_loud,
};

}  // namespace

TEST_CASE("Parse options and positionals") {
    verbosity                level = verbosity::normal;
    std::string              root;
    std::vector<std::string> excludes;

    debate::argument_parser parser;
    parser.add_argument(debate::argument{
        .long_spellings  = {"verbosity"},
        .short_spellings = {"v"},
        .help            = "How loud to be",
        .valname         = "<level>",
        .action          = debate::put_into(level),
    });
    parser.add_argument(debate::argument{
        .long_spellings  = {"exclude"},
        .short_spellings = {"x"},
        .help            = "Skip a directory",
        .can_repeat      = true,
        .action          = debate::push_back_onto(excludes),
    });
    parser.add_argument(debate::argument{
        .help    = "The root to inspect",
        .valname = "<root>",
        .action  = debate::put_into(root),
    });

    parser.parse_argv({"--verbosity=quiet"});
    CHECK(level == verbosity::quiet);
    parser.parse_argv({"--verbosity", "very-loud"});
    CHECK(level == verbosity::very_loud);
    parser.parse_argv({"-vnormal"});
    CHECK(level == verbosity::normal);
    parser.parse_argv({"-v", "quiet", "wezterm"});
    CHECK(level == verbosity::quiet);
    CHECK(root == "wezterm");

    parser.parse_argv({"-x", "target", "--exclude=.git", "term"});
    CHECK(excludes == std::vector<std::string>{"target", ".git"});
    CHECK(root == "term");

    CHECK_THROWS_AS(parser.parse_argv({"--verbosity=shouting"}), debate::invalid_arguments);
    CHECK_THROWS_AS(parser.parse_argv({"-vquiet", "--verbosity=normal"}),
                    debate::invalid_repetition);
    CHECK_THROWS_AS(parser.parse_argv({"--frobnicate"}), debate::unrecognized_argument);
    // A long spelling only matches whole
    CHECK_THROWS_AS(parser.parse_argv({"--verbose=quiet"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"one", "two"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"--verbosity"}), debate::missing_value);
    CHECK_THROWS_AS(parser.parse_argv({"--help"}), debate::help_request);
}

TEST_CASE("Required positional") {
    std::string root;

    debate::argument_parser parser;
    parser.add_argument(debate::argument{
        .help     = "The root to inspect",
        .valname  = "<root>",
        .required = true,
        .action   = debate::put_into(root),
    });
    CHECK_THROWS_AS(parser.parse_argv(std::vector<std::string>{}), debate::missing_required);
    parser.parse_argv({"app"});
    CHECK(root == "app");
}

TEST_CASE("Subcommands") {
    std::optional<std::string> workspace;
    std::optional<std::string> filter;
    std::string                selected;
    std::string                needle;

    debate::argument_parser parser{"Inspect things"};
    parser.add_argument({
        .long_spellings = {"workspace"},
        .valname        = "<dir>",
        .action         = debate::put_into(workspace),
    });
    parser.set_subcommands("What to do", debate::put_into(selected));

    auto& ls_cmd = parser.add_subcommand("ls", "List things");
    ls_cmd.add_argument({
        .long_spellings = {"filter"},
        .action         = debate::put_into(filter),
    });
    auto& tree_cmd = parser.add_subcommand("tree", "Show a tree");
    tree_cmd.add_argument({
        .valname  = "<root>",
        .required = true,
        .action   = debate::put_into(needle),
    });

    parser.parse_argv({"ls"});
    CHECK(selected == "ls");
    CHECK_FALSE(filter);

    CHECK_THROWS_AS(parser.parse_argv({"--workspace=here"}), debate::missing_required);

    parser.parse_argv({"ls", "--filter", "conf"});
    CHECK(filter == "conf");

    // Options of a parent are visible after the subcommand name
    workspace.reset();
    parser.parse_argv({"tree", "app", "--workspace=/src"});
    CHECK(workspace == "/src");
    CHECK(selected == "tree");
    CHECK(needle == "app");

    // ...but subcommand options are not visible before it
    CHECK_THROWS_AS(parser.parse_argv({"--filter=x", "ls"}), debate::unrecognized_argument);
    CHECK_THROWS_AS(parser.parse_argv({"tree"}), debate::missing_required);

    CHECK(tree_cmd.usage_string("pdg") == "Usage: pdg tree <root>");
    CHECK(parser.usage_string("pdg") == "Usage: pdg [--workspace=<dir>] {ls,tree}");
    CHECK(parser.help_string("pdg").find("What to do") != std::string::npos);
}
