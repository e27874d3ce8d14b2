#pragma once
#include <cstddef>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include "arith/eval.hpp"
#include "arith/log.hpp"

namespace arith {

struct ReplConfig {
    std::string prompt{"> "};
    bool show_tree{false};
    LogLevel log_level{LogLevel::Warn};

    /// Defaults overridden by ARITH_PROMPT, ARITH_SHOW_TREE and ARITH_LOG_LEVEL.
    /// Throws std::invalid_argument on an unknown log level.
    static ReplConfig from_env();
    static ReplConfig from_env(const std::map<std::string, std::string>& vars);
};

struct SessionStats {
    std::size_t evaluated{0};
    std::size_t failed{0};
};

/// Integers exactly; doubles in shortest round-trip form, without an
/// exponent for whole numbers below 1e16: 14, 3.5, 1000000000000000, 1e+20.
std::string format_result(const Value& v);

/// Interactive loop: one expression per line, "exit" (any case) stops.
/// Errors are printed and the loop keeps going.
class Repl {
public:
    explicit Repl(ReplConfig config);

    /// Evaluates one line and writes its output. Returns false on "exit".
    bool handle_line(std::string_view line, std::ostream& out);

    /// Runs until "exit" or end of input. Returns the number of failures.
    std::size_t run(std::istream& in, std::ostream& out);

    const SessionStats& stats() const noexcept { return stats_; }

private:
    ReplConfig config_;
    SessionStats stats_{};
};

} // namespace arith
