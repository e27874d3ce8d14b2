#include "arith/eval.hpp"
#include <limits>
#include "arith/parser.hpp"

namespace arith {

namespace {

constexpr Integer int_max = std::numeric_limits<Integer>::max();
constexpr Integer int_min = std::numeric_limits<Integer>::min();

Integer checked_add(Integer a, Integer b) {
    if ((b > 0 && a > int_max - b) || (b < 0 && a < int_min - b)) throw EvalError("Integer overflow");
    return a + b;
}

Integer checked_sub(Integer a, Integer b) {
    if ((b < 0 && a > int_max + b) || (b > 0 && a < int_min + b)) throw EvalError("Integer overflow");
    return a - b;
}

Integer checked_mul(Integer a, Integer b) {
    bool overflow = false;
    if (a > 0) {
        overflow = b > 0 ? a > int_max / b : b < int_min / a;
    } else if (a < 0) {
        overflow = b > 0 ? a < int_min / b : (b != 0 && b < int_max / a);
    }
    if (overflow) throw EvalError("Integer overflow");
    return a * b;
}

double divide(double x, double y) {
    if (y == 0.0) throw EvalError("Division by zero");
    return x / y;
}

struct Evaluator {
    Value operator()(const Literal& lit) const { return lit.value; }

    Value operator()(const BinaryOp& b) const {
        Value l = std::visit(*this, b.left->v);
        Value r = std::visit(*this, b.right->v);

        const auto* x = std::get_if<Integer>(&l);
        const auto* y = std::get_if<Integer>(&r);
        if (x && y) {
            switch (b.op) {
                case BinOp::Add: return checked_add(*x, *y);
                case BinOp::Sub: return checked_sub(*x, *y);
                case BinOp::Mul: return checked_mul(*x, *y);
                case BinOp::Div: break;
            }
            return divide(static_cast<double>(*x), static_cast<double>(*y));
        }

        double dx = to_double(l);
        double dy = to_double(r);
        switch (b.op) {
            case BinOp::Add: return dx + dy;
            case BinOp::Sub: return dx - dy;
            case BinOp::Mul: return dx * dy;
            case BinOp::Div: break;
        }
        return divide(dx, dy);
    }
};

} // namespace

double to_double(const Value& v) {
    if (const auto* i = std::get_if<Integer>(&v)) return static_cast<double>(*i);
    return std::get<double>(v);
}

Value evaluate(const Node& n) {
    return std::visit(Evaluator{}, n.v);
}

Value evaluate(std::string_view input) {
    NodePtr root = parse(input);
    return evaluate(*root);
}

} // namespace arith
