#include "./argument_parser.hpp"

#include <boost/leaf/exception.hpp>
#include <boost/leaf/on_error.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <set>

using strv = std::string_view;

using namespace debate;

namespace {

/**
 * Walks the words of a command line, dispatching each to the argument that claims it. The
 * "active" parser starts at the top-level parser and moves down each time a subcommand name is
 * consumed.
 */
class parse_engine {
    const std::vector<strv>& _words;
    std::size_t              _pos = 0;

    const argument_parser* _active;

    // Index of the next positional argument of the active parser
    int _positional_index = 0;

    std::set<const argument*> _seen;

    bool _at_end() const noexcept { return _pos == _words.size(); }
    strv _current() const noexcept { return _words[_pos]; }

    // Search the active parser, then each of its ancestors
    template <typename Match>
    std::pair<const argument*, strv> _find_option(Match&& match) const {
        for (auto p = _active; p; p = p->parent().pointer()) {
            for (const argument& cand : p->arguments()) {
                if (auto spelling = match(cand)) {
                    return {&cand, *spelling};
                }
            }
        }
        BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unrecognized argument"),
                                   e_arg_spelling{std::string(_current())});
    }

    void _invoke(const argument& arg, strv value, strv spelling) {
        if (!_seen.insert(&arg).second && !arg.can_repeat) {
            BOOST_LEAF_THROW_EXCEPTION(invalid_repetition("Argument given more than once"));
        }
        arg.action(value, spelling);
    }

    // The value of an option given as a separate word
    strv _next_word_value() {
        ++_pos;
        if (_at_end()) {
            BOOST_LEAF_THROW_EXCEPTION(missing_value("Expected a value"));
        }
        return _current();
    }

    void _parse_long(strv text) {
        if (text == "help") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        auto [arg, matched] = _find_option([&](const argument& a) { return a.match_long(text); });
        auto spelling       = fmt::format("--{}", matched);
        auto _              = boost::leaf::on_error(e_argument{*arg}, e_arg_spelling{spelling});

        auto rest = text.substr(matched.size());
        // '--name=value' or '--name value'
        auto value = rest.empty() ? _next_word_value() : rest.substr(1);
        _invoke(*arg, value, spelling);
        ++_pos;
    }

    void _parse_short(strv text) {
        if (text == "h") {
            BOOST_LEAF_THROW_EXCEPTION(help_request());
        }
        auto [arg, matched] = _find_option([&](const argument& a) { return a.match_short(text); });
        auto spelling       = fmt::format("-{}", matched);
        auto _              = boost::leaf::on_error(e_argument{*arg}, e_arg_spelling{spelling});

        auto rest = text.substr(matched.size());
        // '-xvalue' or '-x value'
        auto value = rest.empty() ? _next_word_value() : rest;
        _invoke(*arg, value, spelling);
        ++_pos;
    }

    bool _try_positional(strv given) {
        int idx = 0;
        for (auto& arg : _active->arguments()) {
            if (!arg.is_positional() || idx++ != _positional_index) {
                continue;
            }
            auto _ = boost::leaf::on_error(e_argument{arg},
                                           e_arg_spelling{arg.preferred_spelling()});
            _invoke(arg, given, arg.valname);
            if (!arg.can_repeat) {
                ++_positional_index;
            }
            ++_pos;
            return true;
        }
        return false;
    }

    bool _try_subcommand(strv given) {
        auto& subs = _active->subcommands();
        if (!subs) {
            return false;
        }
        for (auto& cand : subs->parsers) {
            if (cand.name() != given) {
                continue;
            }
            if (subs->action) {
                subs->action(given, given);
            }
            _active           = &cand;
            _positional_index = 0;
            ++_pos;
            return true;
        }
        return false;
    }

    void _check_required() const {
        for (auto p = _active; p; p = p->parent().pointer()) {
            for (auto& arg : p->arguments()) {
                if (arg.required && !_seen.contains(&arg)) {
                    BOOST_LEAF_THROW_EXCEPTION(missing_required("Required argument is missing"),
                                               e_argument{arg});
                }
            }
        }
        if (_active->subcommands()) {
            BOOST_LEAF_THROW_EXCEPTION(missing_required("Expected a subcommand"));
        }
    }

public:
    parse_engine(const std::vector<strv>& words, const argument_parser& top)
        : _words(words)
        , _active(&top) {}

    void run() {
        auto _ = boost::leaf::on_error([this] { return e_argument_parser{*_active}; });
        while (!_at_end()) {
            auto given = _current();
            if (given.size() > 2 && given.starts_with("--")) {
                _parse_long(given.substr(2));
            } else if (given.size() > 1 && given[0] == '-') {
                _parse_short(given.substr(1));
            } else if (!_try_positional(given) && !_try_subcommand(given)) {
                BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument("Unexpected argument"),
                                           e_arg_spelling{std::string(given)});
            }
        }
        _check_required();
    }
};

}  // namespace

void argument_parser::_parse_words(const std::vector<strv>& words) const {
    parse_engine{words, *this}.run();
}

argument& argument_parser::add_argument(argument arg) {
    _arguments.push_back(std::move(arg));
    return _arguments.back();
}

void argument_parser::set_subcommands(std::string description, action_fn action) {
    _subcommands.emplace(subcommand_set{
        .description = std::move(description),
        .action      = std::move(action),
    });
}

argument_parser& argument_parser::add_subcommand(std::string name, std::string description) {
    if (!_subcommands) {
        _subcommands.emplace();
    }
    return _subcommands->parsers.emplace_back(std::move(name), std::move(description), *this);
}

std::string argument_parser::usage_string(std::string_view progname) const {
    // The names of this parser and its ancestors, outermost first
    std::vector<std::string> pieces;
    for (auto p = this; p; p = p->parent().pointer()) {
        if (!p->name().empty()) {
            pieces.insert(pieces.begin(), p->name());
        }
    }
    pieces.insert(pieces.begin(), std::string(progname));

    for (auto& arg : _arguments) {
        pieces.push_back(arg.syntax_string());
    }
    if (_subcommands) {
        std::vector<strv> names;
        for (auto& sub : _subcommands->parsers) {
            names.push_back(sub.name());
        }
        pieces.push_back(fmt::format("{{{}}}", fmt::join(names, ",")));
    }
    return fmt::format("Usage: {}", fmt::join(pieces, " "));
}

std::string argument_parser::help_string(std::string_view progname) const {
    auto ret = usage_string(progname) + "\n\n";
    if (!_description.empty()) {
        ret += _description + "\n\n";
    }

    auto add_section = [&](strv title, bool required) {
        std::string body;
        for (auto& arg : _arguments) {
            if (arg.required == required) {
                body += arg.help_string() + "\n";
            }
        }
        if (!body.empty()) {
            ret += fmt::format("{}:\n\n{}", title, body);
        }
    };
    add_section("Required arguments", true);
    add_section("Options", false);

    if (_subcommands) {
        ret += "Subcommands:\n\n";
        if (!_subcommands->description.empty()) {
            ret += fmt::format("  {}\n\n", _subcommands->description);
        }
        for (auto& sub : _subcommands->parsers) {
            ret += fmt::format(fmt::emphasis::bold, "{}", sub.name());
            ret += fmt::format("\n  {}\n\n", sub.description());
        }
    }
    return ret;
}
