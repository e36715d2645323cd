#include "./styled.hpp"

#include <magic_enum.hpp>

#include <cctype>
#include <optional>
#include <unordered_map>
#include <vector>

#include <unistd.h>

using namespace fansi;

namespace {

enum class color {
    black,
    red,
    green,
    yellow,
    blue,
    magenta,
    cyan,
    white,
};

struct text_style {
    std::optional<color> fg;

    bool bright    = false;
    bool bold      = false;
    bool italic    = false;
    bool underline = false;

    bool apply(std::string_view cls) {
        if (auto col = magic_enum::enum_cast<color>(cls)) {
            fg = *col;
        } else if (cls == "br") {
            bright = true;
        } else if (cls == "bold") {
            bold = true;
        } else if (cls == "italic") {
            italic = true;
        } else if (cls == "underline") {
            underline = true;
        } else {
            return false;
        }
        return true;
    }

    // Every change of style resets the terminal and then enables the full new style
    std::string sgr() const {
        std::string codes = "0";
        if (bold) {
            codes += ";1";
        }
        if (italic) {
            codes += ";3";
        }
        if (underline) {
            codes += ";4";
        }
        if (fg) {
            codes += ";" + std::to_string((bright ? 90 : 30) + int(*fg));
        }
        return "\x1b[" + codes + "m";
    }
};

class markup_renderer {
    std::string_view        _in;
    bool                    _emit_sgr;
    std::string             _out;
    std::vector<text_style> _stack{text_style{}};

    // `pos` is at a '.'. Returns the position after the opening '[' if a style begins here.
    std::optional<std::size_t> _open_style(std::size_t pos) {
        auto first = pos + 1;
        if (first >= _in.size() || !std::isalpha(static_cast<unsigned char>(_in[first]))) {
            return std::nullopt;
        }
        auto bracket = _in.find('[', first);
        if (bracket == _in.npos) {
            return std::nullopt;
        }
        auto style   = _stack.back();
        auto classes = _in.substr(first, bracket - first);
        while (!classes.empty()) {
            auto dot = classes.find('.');
            if (!style.apply(classes.substr(0, dot))) {
                return std::nullopt;
            }
            classes = dot == classes.npos ? std::string_view{} : classes.substr(dot + 1);
        }
        _stack.push_back(style);
        _emit();
        return bracket + 1;
    }

    void _emit() {
        if (_emit_sgr) {
            _out += _stack.back().sgr();
        }
    }

public:
    markup_renderer(std::string_view in, bool emit_sgr)
        : _in(in)
        , _emit_sgr(emit_sgr) {}

    std::string render() && {
        std::size_t pos = 0;
        while (pos < _in.size()) {
            char c = _in[pos];
            if (c == '.') {
                if (auto after = _open_style(pos)) {
                    pos = *after;
                    continue;
                }
            }
            if (c == '`' && pos + 1 < _in.size()) {
                _out.push_back(_in[pos + 1]);
                pos += 2;
            } else if (c == ']' && _stack.size() > 1) {
                _stack.pop_back();
                _emit();
                ++pos;
            } else {
                _out.push_back(c);
                ++pos;
            }
        }
        return std::move(_out);
    }
};

}  // namespace

std::string fansi::stylize(std::string_view text, should_style should) {
    bool emit = should == should_style::force
        || (should == should_style::detect && ::isatty(STDERR_FILENO));
    return markup_renderer{text, emit}.render();
}

const std::string& fansi::detail::rendered_literal(const char* literal) {
    thread_local std::unordered_map<const char*, std::string> rendered;
    auto [it, inserted] = rendered.try_emplace(literal);
    if (inserted) {
        it->second = stylize(literal);
    }
    return it->second;
}
