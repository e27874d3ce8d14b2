#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arith {

using Integer = std::int64_t;

enum class TokKind {
    Number,

    Plus, Minus, Star, Slash,
    LParen, RParen,
    End,
};

struct Token {
    TokKind kind{TokKind::End};
    std::optional<Integer> value{}; // Number only
};

inline bool operator==(const Token& a, const Token& b) {
    return a.kind == b.kind && a.value == b.value;
}
inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

/// NUMBER, PLUS, ..., END_OF_INPUT
const char* to_string(TokKind k);

/// Token(NUMBER, 42), Token(PLUS, '+'), Token(END_OF_INPUT)
std::string to_string(const Token& t);

/// Source text of a punctuation kind; empty for Number and End.
std::string_view spelling(TokKind k);

/// Canonical re-rendering: literals and operators separated by single spaces.
/// End tokens are skipped.
std::string render(const std::vector<Token>& tokens);

} // namespace arith
