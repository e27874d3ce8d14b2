#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace arith {

/// Base of every failure raised by the lexer, parser and evaluator.
struct Error : std::runtime_error { using std::runtime_error::runtime_error; };

struct LexicalError : Error {
    LexicalError(const std::string& what, std::size_t position)
        : Error(what), position_(position) {}

    /// Index of the offending character in the input.
    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

struct ParsingError : Error { using Error::Error; };
struct EvalError    : Error { using Error::Error; };

} // namespace arith
