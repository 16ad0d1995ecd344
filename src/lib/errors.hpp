#pragma once

#include <stdexcept>
#include <string>

// Fatal conditions of a single invocation. Library code throws these, each
// command catches them once at the top and exits non-zero.

// A store or observed file could not be created, opened, read or written.
struct IOError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The version store holds no line of the form "Version: <digits>".
struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// The next version number cannot be represented.
struct ArithmeticError : std::runtime_error {
    using std::runtime_error::runtime_error;
};
