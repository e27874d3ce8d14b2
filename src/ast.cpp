#include "arith/ast.hpp"
#include <algorithm>
#include <ostream>

namespace arith {

template <class... Fs> struct overloaded : Fs... { using Fs::operator()...; };
template <class... Fs> overloaded(Fs...) -> overloaded<Fs...>;

NodePtr make_literal(Integer value) {
    return std::make_unique<Node>(Node{Literal{value}, 1});
}

NodePtr make_binary(BinOp op, NodePtr left, NodePtr right) {
    const std::size_t depth = 1 + std::max(left->depth, right->depth);
    return std::make_unique<Node>(Node{BinaryOp{op, std::move(left), std::move(right)}, depth});
}

bool equal(const Node& a, const Node& b) {
    if (a.v.index() != b.v.index()) return false;
    if (const auto* la = std::get_if<Literal>(&a.v)) {
        return la->value == std::get<Literal>(b.v).value;
    }
    const auto& x = std::get<BinaryOp>(a.v);
    const auto& y = std::get<BinaryOp>(b.v);
    return x.op == y.op && equal(*x.left, *y.left) && equal(*x.right, *y.right);
}

char symbol(BinOp op) {
    switch (op) {
        case BinOp::Add: return '+';
        case BinOp::Sub: return '-';
        case BinOp::Mul: return '*';
        case BinOp::Div: return '/';
    }
    return '?';
}

TokKind token_kind(BinOp op) {
    switch (op) {
        case BinOp::Add: return TokKind::Plus;
        case BinOp::Sub: return TokKind::Minus;
        case BinOp::Mul: return TokKind::Star;
        case BinOp::Div: return TokKind::Slash;
    }
    return TokKind::End;
}

// Literals bind tightest.
static int precedence(const Node& n) {
    const auto* b = std::get_if<BinaryOp>(&n.v);
    if (!b) return 3;
    return (b->op == BinOp::Mul || b->op == BinOp::Div) ? 2 : 1;
}

static void write_infix(const Node& n, std::string& out) {
    std::visit(overloaded{
        [&](const Literal& lit) { out += std::to_string(lit.value); },
        [&](const BinaryOp& b) {
            const int p = precedence(n);
            // Operators are left-associative: a right child of equal
            // precedence needs parentheses, a left child does not.
            const bool wrap_left = precedence(*b.left) < p;
            const bool wrap_right = precedence(*b.right) <= p;

            if (wrap_left) out += '(';
            write_infix(*b.left, out);
            if (wrap_left) out += ')';

            out += ' ';
            out += symbol(b.op);
            out += ' ';

            if (wrap_right) out += '(';
            write_infix(*b.right, out);
            if (wrap_right) out += ')';
        },
    }, n.v);
}

std::string to_string(const Node& n) {
    std::string out;
    write_infix(n, out);
    return out;
}

void dump_tree(const Node& n, std::ostream& os, int level) {
    const std::string indent(static_cast<std::size_t>(level) * 2, ' ');
    std::visit(overloaded{
        [&](const Literal& lit) { os << indent << "Num(" << lit.value << ")\n"; },
        [&](const BinaryOp& b) {
            os << indent << "BinOp:\n";
            os << indent << "  left:\n";
            dump_tree(*b.left, os, level + 2);
            os << indent << "  op: " << to_string(token_kind(b.op)) << "\n";
            os << indent << "  right:\n";
            dump_tree(*b.right, os, level + 2);
        },
    }, n.v);
}

} // namespace arith
