#pragma once

#include <stdexcept>
#include <string>

namespace debate {

struct argument;
class argument_parser;

/// Thrown for '--help' or '-h'
struct help_request : std::exception {};

/// Base of all errors caused by a bad command line
struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

/// A word that no argument or subcommand accepts
struct unrecognized_argument : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// A required argument or subcommand was not given
struct missing_required : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// A non-repeatable argument was given twice
struct invalid_repetition : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// An option appeared at the end of the command line without its value
struct missing_value : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct e_argument {
    const debate::argument& value;
};

/// The parser of the subcommand being parsed when the error occurred
struct e_argument_parser {
    const debate::argument_parser& value;
};

struct e_invalid_arg_value {
    std::string value;
};

/// The argument as it was spelled on the command line
struct e_arg_spelling {
    std::string value;
};

}  // namespace debate
