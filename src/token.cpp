#include "arith/token.hpp"

namespace arith {

const char* to_string(TokKind k) {
    switch (k) {
        case TokKind::Number: return "NUMBER";
        case TokKind::Plus:   return "PLUS";
        case TokKind::Minus:  return "MINUS";
        case TokKind::Star:   return "STAR";
        case TokKind::Slash:  return "SLASH";
        case TokKind::LParen: return "LPAREN";
        case TokKind::RParen: return "RPAREN";
        case TokKind::End:    return "END_OF_INPUT";
    }
    return "?";
}

std::string_view spelling(TokKind k) {
    switch (k) {
        case TokKind::Plus:   return "+";
        case TokKind::Minus:  return "-";
        case TokKind::Star:   return "*";
        case TokKind::Slash:  return "/";
        case TokKind::LParen: return "(";
        case TokKind::RParen: return ")";
        case TokKind::Number:
        case TokKind::End:    break;
    }
    return {};
}

std::string to_string(const Token& t) {
    std::string out = "Token(";
    out += to_string(t.kind);
    if (t.kind == TokKind::Number) {
        out += ", ";
        out += t.value ? std::to_string(*t.value) : std::string("?");
    } else if (t.kind != TokKind::End) {
        out += ", '";
        out += spelling(t.kind);
        out += "'";
    }
    out += ")";
    return out;
}

std::string render(const std::vector<Token>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (t.kind == TokKind::End) continue;
        if (!out.empty()) out += ' ';
        if (t.kind == TokKind::Number) out += std::to_string(t.value.value_or(0));
        else out += spelling(t.kind);
    }
    return out;
}

} // namespace arith
