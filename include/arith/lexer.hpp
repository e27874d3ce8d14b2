#pragma once
#include <string_view>
#include <vector>
#include "arith/error.hpp"
#include "arith/token.hpp"

namespace arith {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Next token of the input; End forever once the input is exhausted.
    /// Throws LexicalError on an unsupported character or an oversized literal.
    Token next();

    std::size_t position() const noexcept { return i_; }

private:
    void skip_ws();
    Token number();
    bool is_end() const { return i_ >= s_.size(); }

    std::string_view s_;
    std::size_t i_{0};
};

/// All tokens of the input up to and including the first End.
std::vector<Token> tokenize(std::string_view input);

} // namespace arith
