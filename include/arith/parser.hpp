#pragma once
#include <cstddef>
#include <string_view>
#include "arith/ast.hpp"
#include "arith/lexer.hpp"

namespace arith {

// Recursive descent over
//   expression := term (('+' | '-') term)*
//   term       := factor (('*' | '/') factor)*
//   factor     := NUMBER | '(' expression ')'
class Parser {
public:
    /// Deepest tree or parenthesis nesting accepted; deeper input is a
    /// ParsingError so that evaluation and teardown stay within the stack.
    static constexpr std::size_t max_depth = 1000;

    /// Pulls the first token immediately; lexical errors may surface here.
    explicit Parser(Lexer& lex);

    /// Parses one expression. Tokens after it are left unconsumed.
    NodePtr parse_expression();

    /// Parses one expression and requires the input to end there.
    NodePtr parse();

    const Token& current() const noexcept { return cur_; }

private:
    void eat(TokKind kind);
    NodePtr term();
    NodePtr factor();
    NodePtr fold(BinOp op, NodePtr left, NodePtr right);

    Lexer& lex_;
    Token cur_;
    std::size_t nesting_{0};
};

/// Strict parse of a whole string. Throws LexicalError or ParsingError.
NodePtr parse(std::string_view input);

} // namespace arith
