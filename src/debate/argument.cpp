#include "./argument.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

using namespace debate;

std::optional<std::string_view> argument::match_long(std::string_view text) const noexcept {
    for (auto& spelling : long_spellings) {
        if (text == spelling) {
            return spelling;
        }
        if (text.starts_with(spelling) && text.substr(spelling.size()).starts_with('=')) {
            return spelling;
        }
    }
    return std::nullopt;
}

std::optional<std::string_view> argument::match_short(std::string_view text) const noexcept {
    for (auto& spelling : short_spellings) {
        if (text.starts_with(spelling)) {
            return spelling;
        }
    }
    return std::nullopt;
}

std::string argument::preferred_spelling() const {
    if (!long_spellings.empty()) {
        return "--" + long_spellings.front();
    }
    if (!short_spellings.empty()) {
        return "-" + short_spellings.front();
    }
    return valname;
}

std::string argument::syntax_string() const {
    auto shown_val = valname.empty() ? std::string("<value>") : valname;

    std::string one;
    if (is_positional()) {
        one = shown_val;
    } else if (!long_spellings.empty()) {
        one = fmt::format("--{}={}", long_spellings.front(), shown_val);
    } else {
        one = fmt::format("-{} {}", short_spellings.front(), shown_val);
    }

    auto body = can_repeat ? fmt::format("{} [{} [...]]", one, one) : one;
    if (required) {
        return body;
    }
    return fmt::format("[{}]", body);
}

std::string argument::help_string() const {
    auto shown_val = valname.empty() ? std::string("<value>") : valname;

    std::vector<std::string> spellings;
    for (auto& l : long_spellings) {
        spellings.push_back(fmt::format(fmt::emphasis::bold, "--{}", l)
                            + fmt::format(fmt::emphasis::italic, "={}", shown_val));
    }
    for (auto& s : short_spellings) {
        spellings.push_back(fmt::format(fmt::emphasis::bold, "-{}", s)
                            + fmt::format(fmt::emphasis::italic, " {}", shown_val));
    }
    if (is_positional()) {
        spellings.push_back(fmt::format(fmt::emphasis::bold, "{}", shown_val));
    }

    std::string ret;
    for (auto& sp : spellings) {
        ret += sp;
        ret += '\n';
    }
    // Continuation lines of the help text keep the same indentation
    std::string indented = "  ";
    for (char c : help) {
        indented += c;
        if (c == '\n') {
            indented += "  ";
        }
    }
    ret += indented;
    ret += '\n';
    return ret;
}
