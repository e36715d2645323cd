#include "./dym.hpp"

#include <range/v3/numeric/iota.hpp>
#include <range/v3/view/enumerate.hpp>
#include <range/v3/view/iota.hpp>

#include <algorithm>

std::size_t pdg::lev_edit_distance(std::string_view a, std::string_view b) {
    // Two rows of the distance table: `prev` for b[..i], `cur` for b[..i+1]
    std::vector<std::size_t> prev(a.size() + 1);
    std::vector<std::size_t> cur(a.size() + 1);
    ranges::iota(prev, std::size_t(0));

    for (auto [i, b_char] : ranges::views::enumerate(b)) {
        cur[0] = i + 1;
        for (auto col : ranges::views::iota(std::size_t(1), cur.size())) {
            auto substitute = prev[col - 1] + (a[col - 1] == b_char ? 0 : 1);
            cur[col]        = std::min({prev[col] + 1, cur[col - 1] + 1, substitute});
        }
        std::swap(prev, cur);
    }
    return prev.back();
}

std::optional<std::string> pdg::did_you_mean(std::string_view                given,
                                             const std::vector<std::string>& candidates) {
    std::optional<std::string> nearest;
    std::size_t                best = 0;
    for (auto& cand : candidates) {
        auto dist = lev_edit_distance(cand, given);
        if (!nearest || dist < best) {
            nearest = cand;
            best    = dist;
        }
    }
    return nearest;
}
