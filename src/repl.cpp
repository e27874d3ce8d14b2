#include "arith/repl.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <utility>
#include "arith/parser.hpp"

namespace arith {

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

static bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

static bool parse_flag(std::string_view s) {
    s = trim(s);
    return iequals(s, "1") || iequals(s, "true") || iequals(s, "yes") || iequals(s, "on");
}

ReplConfig ReplConfig::from_env(const std::map<std::string, std::string>& vars) {
    ReplConfig cfg;
    if (auto it = vars.find("ARITH_PROMPT"); it != vars.end()) cfg.prompt = it->second;
    if (auto it = vars.find("ARITH_SHOW_TREE"); it != vars.end()) cfg.show_tree = parse_flag(it->second);
    if (auto it = vars.find("ARITH_LOG_LEVEL"); it != vars.end()) cfg.log_level = parse_log_level(trim(it->second));
    return cfg;
}

ReplConfig ReplConfig::from_env() {
    std::map<std::string, std::string> vars;
    for (const char* name : {"ARITH_PROMPT", "ARITH_SHOW_TREE", "ARITH_LOG_LEVEL"}) {
        if (const char* v = std::getenv(name)) vars[name] = v;
    }
    return from_env(vars);
}

std::string format_result(const Value& v) {
    if (const auto* i = std::get_if<Integer>(&v)) return std::to_string(*i);

    const double d = std::get<double>(v);
    const bool whole = std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e16;
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d, whole ? std::chars_format::fixed : std::chars_format::general);
    if (ec != std::errc{}) throw std::runtime_error("Cannot format result");
    return std::string(buf, ptr);
}

Repl::Repl(ReplConfig config) : config_(std::move(config)) {}

bool Repl::handle_line(std::string_view line, std::ostream& out) {
    std::string_view text = trim(line);
    if (iequals(text, "exit")) {
        out << "Exiting.\n";
        return false;
    }
    if (text.empty()) return true;

    ++stats_.evaluated;
    try {
        NodePtr root = parse(text);
        if (config_.show_tree) dump_tree(*root, out);
        Value v = evaluate(*root);
        ARITH_LOG(LogLevel::Debug, "'" << text << "' = " << format_result(v));
        out << format_result(v) << "\n";
    } catch (const Error& e) {
        ++stats_.failed;
        ARITH_LOG(LogLevel::Warn, "'" << text << "' failed: " << e.what());
        out << "error: " << e.what() << "\n";
    }
    return true;
}

std::size_t Repl::run(std::istream& in, std::ostream& out) {
    ARITH_LOG(LogLevel::Info, "session started");
    std::string line;
    for (;;) {
        out << config_.prompt << std::flush;
        if (!std::getline(in, line)) {
            out << "\n";
            break;
        }
        if (!handle_line(line, out)) break;
    }
    ARITH_LOG(LogLevel::Info, "session ended: " << stats_.evaluated << " evaluated, " << stats_.failed << " failed");
    return stats_.failed;
}

} // namespace arith
