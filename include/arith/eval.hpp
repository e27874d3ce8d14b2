#pragma once
#include <string_view>
#include <variant>
#include "arith/ast.hpp"
#include "arith/error.hpp"

namespace arith {

/// Integer while only + - * are involved; division yields double.
using Value = std::variant<Integer, double>;

/// Evaluate a tree bottom-up, left operand before right.
/// Integer + - * are exact and throw EvalError on overflow.
/// Division is true division; a zero divisor throws EvalError.
Value evaluate(const Node& n);

/// Strict parse + evaluate of a whole string.
Value evaluate(std::string_view input);

double to_double(const Value& v);

} // namespace arith
