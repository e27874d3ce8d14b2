#pragma once
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <variant>
#include "arith/token.hpp"

namespace arith {

enum class BinOp { Add, Sub, Mul, Div };

struct Node;
using NodePtr = std::unique_ptr<Node>;

struct Literal {
    Integer value{0};
};

struct BinaryOp {
    BinOp op{BinOp::Add};
    NodePtr left;
    NodePtr right;
};

/// Expression tree node. Children are owned by their BinaryOp parent.
struct Node {
    std::variant<Literal, BinaryOp> v;
    std::size_t depth{1}; // levels in this subtree, 1 for a literal
};

NodePtr make_literal(Integer value);
NodePtr make_binary(BinOp op, NodePtr left, NodePtr right);

/// Structural equality of two trees.
bool equal(const Node& a, const Node& b);

char symbol(BinOp op);
TokKind token_kind(BinOp op);

/// Infix text with only the parentheses needed to keep the tree's shape.
std::string to_string(const Node& n);

/// Indented multi-line dump, two spaces per level:
///   BinOp:
///     left:
///       Num(1)
///     op: PLUS
///     right:
///       Num(2)
void dump_tree(const Node& n, std::ostream& os, int level = 0);

} // namespace arith
