#pragma once

#include "./argument.hpp"

#include <neo/opt_ref.hpp>

#include <initializer_list>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace debate {

class argument_parser;

/**
 * @brief The subcommands of a parser. Exactly one of them must be named on the command line.
 */
struct subcommand_set {
    /// Shown above the list of subcommands in help output
    std::string description{};

    /// Called with the name of the subcommand that was selected
    action_fn action{};

    std::list<argument_parser> parsers{};
};

/**
 * @brief Parses a command line into the actions of its arguments.
 *
 * A subcommand has a parser of its own. Options that a subcommand's parser does not know are looked
 * up in the parsers above it, so global options may follow the subcommand name.
 */
class argument_parser {
    std::string                         _name;
    std::string                         _description;
    neo::opt_ref<const argument_parser> _parent;

    // A list keeps arguments at a stable address while more are added
    std::list<argument>           _arguments;
    std::optional<subcommand_set> _subcommands;

    void _parse_words(const std::vector<std::string_view>& words) const;

public:
    explicit argument_parser(std::string description = {})
        : _description(std::move(description)) {}

    argument_parser(std::string name, std::string description, const argument_parser& parent)
        : _name(std::move(name))
        , _description(std::move(description))
        , _parent(parent) {}

    argument& add_argument(argument arg);

    /// Attach the set of subcommands. Subcommands are then added with add_subcommand()
    void set_subcommands(std::string description, action_fn action);

    argument_parser& add_subcommand(std::string name, std::string description);

    /// A single usage line, such as 'Usage: pdg tree <root-project>'
    std::string usage_string(std::string_view progname) const;

    std::string help_string(std::string_view progname) const;

    /**
     * @brief Parse the given command-line words, not including the program name.
     *
     * Actions run in the order their arguments appear. Errors are thrown as LEAF exceptions
     * deriving from `invalid_arguments`, and '--help' throws a `help_request`. The parser that was
     * active is attached to every error as an `e_argument_parser`.
     */
    template <typename R>
    void parse_argv(R&& range) const {
        std::vector<std::string_view> words;
        for (auto&& w : range) {
            words.emplace_back(w);
        }
        _parse_words(words);
    }

    template <typename T>
    void parse_argv(std::initializer_list<T> ilist) const {
        _parse_words(std::vector<std::string_view>(ilist.begin(), ilist.end()));
    }

    auto& name() const noexcept { return _name; }
    auto& description() const noexcept { return _description; }
    auto  parent() const noexcept { return _parent; }
    auto& arguments() const noexcept { return _arguments; }
    auto& subcommands() const noexcept { return _subcommands; }
};

}  // namespace debate
