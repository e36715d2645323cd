#include "./styled.hpp"

#include <catch2/catch.hpp>

namespace {

std::string render(std::string_view markup) {
    return fansi::stylize(markup, fansi::should_style::force);
}

}  // namespace

TEST_CASE("Render style markup") {
    CHECK(render("plain text") == "plain text");
    CHECK(render("foo .bold[bar] baz") == "foo \x1b[0;1mbar\x1b[0m baz");
    CHECK(render(".bold.red[cycle]") == "\x1b[0;1;31mcycle\x1b[0m");
    CHECK(render(".br.yellow[termwiz]") == "\x1b[0;93mtermwiz\x1b[0m");
    CHECK(render(".red[a .bold[b] c]") == "\x1b[0;31ma \x1b[0;1;31mb\x1b[0;31m c\x1b[0m");
}

TEST_CASE("Escapes and plain dots") {
    CHECK(render("foo `.bold[x`]") == "foo .bold[x]");
    CHECK(render("Reading [Cargo.toml]") == "Reading [Cargo.toml]");
    CHECK(render("see .nonsense[here]") == "see .nonsense[here]");
    CHECK(render("trailing.") == "trailing.");
    CHECK(render("a ] stray bracket") == "a ] stray bracket");
}

TEST_CASE("Markup is removed when styling is disabled") {
    CHECK(fansi::stylize("Error: .bold.red[{}]", fansi::should_style::never) == "Error: {}");
}
