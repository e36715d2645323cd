#include "./dym.hpp"

#include <catch2/catch.hpp>

#include <vector>

TEST_CASE("Edit distance") {
    CHECK(pdg::lev_edit_distance("a", "a") == 0);
    CHECK(pdg::lev_edit_distance("a", "b") == 1);
    CHECK(pdg::lev_edit_distance("aa", "a") == 1);
    CHECK(pdg::lev_edit_distance("", "term") == 4);
    CHECK(pdg::lev_edit_distance("termwiz", "") == 7);
    CHECK(pdg::lev_edit_distance("kitten", "sitting") == 3);
    CHECK(pdg::lev_edit_distance("config", "cofnig") == 2);
}

TEST_CASE("Find the 'did-you-mean' candidate") {
    auto cand = pdg::did_you_mean("food", {"foo", "bar"});
    CHECK(cand == "foo");
    cand = pdg::did_you_mean("eatable", {"edible", "tangible"});
    CHECK(cand == "edible");

    std::vector<std::string> dirs = {"termwiz", "mux", "wezterm-gui"};
    CHECK(pdg::did_you_mean("termwix", dirs) == "termwiz");

    // Ties go to the first candidate
    CHECK(pdg::did_you_mean("mix", {"mux", "max"}) == "mux");

    std::vector<std::string> none;
    CHECK_FALSE(pdg::did_you_mean("term", none).has_value());
}
