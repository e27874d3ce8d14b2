#include "arith/parser.hpp"
#include <string>

namespace arith {

static std::string describe(const Token& t) {
    if (t.kind == TokKind::End) return "end of input";
    if (t.kind == TokKind::Number) return "number " + std::to_string(t.value.value_or(0));
    return "'" + std::string(spelling(t.kind)) + "'";
}

static std::string describe(TokKind k) {
    if (k == TokKind::End) return "end of input";
    if (k == TokKind::Number) return "a number";
    return "'" + std::string(spelling(k)) + "'";
}

Parser::Parser(Lexer& lex) : lex_(lex), cur_(lex.next()) {}

void Parser::eat(TokKind kind) {
    if (cur_.kind != kind) {
        throw ParsingError("Expected " + describe(kind) + " but found " + describe(cur_));
    }
    cur_ = lex_.next();
}

NodePtr Parser::factor() {
    if (cur_.kind == TokKind::Number) {
        Integer v = cur_.value.value_or(0);
        eat(TokKind::Number);
        return make_literal(v);
    }
    if (cur_.kind == TokKind::LParen) {
        if (nesting_ >= max_depth) throw ParsingError("Expression nested too deeply");
        eat(TokKind::LParen);
        ++nesting_;
        NodePtr node = parse_expression();
        --nesting_;
        eat(TokKind::RParen);
        return node;
    }
    throw ParsingError("Unexpected token: " + describe(cur_));
}

NodePtr Parser::fold(BinOp op, NodePtr left, NodePtr right) {
    NodePtr node = make_binary(op, std::move(left), std::move(right));
    if (node->depth > max_depth) throw ParsingError("Expression nested too deeply");
    return node;
}

NodePtr Parser::term() {
    NodePtr node = factor();
    while (cur_.kind == TokKind::Star || cur_.kind == TokKind::Slash) {
        BinOp op = cur_.kind == TokKind::Star ? BinOp::Mul : BinOp::Div;
        eat(cur_.kind);
        node = fold(op, std::move(node), factor());
    }
    return node;
}

NodePtr Parser::parse_expression() {
    NodePtr node = term();
    while (cur_.kind == TokKind::Plus || cur_.kind == TokKind::Minus) {
        BinOp op = cur_.kind == TokKind::Plus ? BinOp::Add : BinOp::Sub;
        eat(cur_.kind);
        node = fold(op, std::move(node), term());
    }
    return node;
}

NodePtr Parser::parse() {
    NodePtr node = parse_expression();
    eat(TokKind::End);
    return node;
}

NodePtr parse(std::string_view input) {
    Lexer lex(input);
    Parser p(lex);
    return p.parse();
}

} // namespace arith
