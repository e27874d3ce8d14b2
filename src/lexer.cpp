#include "arith/lexer.hpp"
#include <cctype>
#include <charconv>
#include <string>

namespace arith {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::number() {
    std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;

    Integer v = 0;
    const char* first = s_.data() + start;
    const char* last = s_.data() + i_;
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec == std::errc::result_out_of_range) {
        throw LexicalError("Integer literal out of range: " + std::string(s_.substr(start, i_ - start)), start);
    }
    if (ec != std::errc{} || ptr != last) throw LexicalError("Invalid integer literal", start);

    Token t{TokKind::Number};
    t.value = v;
    return t;
}

Token Lexer::next() {
    skip_ws();
    if (is_end()) return {TokKind::End};

    char c = s_[i_];

    switch (c) {
        case '+': ++i_; return {TokKind::Plus};
        case '-': ++i_; return {TokKind::Minus};
        case '*': ++i_; return {TokKind::Star};
        case '/': ++i_; return {TokKind::Slash};
        case '(': ++i_; return {TokKind::LParen};
        case ')': ++i_; return {TokKind::RParen};
        default: break;
    }

    if (is_digit(c)) return number();

    throw LexicalError(std::string("Unexpected character '") + c + "' at position " + std::to_string(i_), i_);
}

std::vector<Token> tokenize(std::string_view input) {
    Lexer lex(input);
    std::vector<Token> out;
    for (;;) {
        out.push_back(lex.next());
        if (out.back().kind == TokKind::End) break;
    }
    return out;
}

} // namespace arith
