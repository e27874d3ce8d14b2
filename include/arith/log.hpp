#pragma once
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace arith {

enum class LogLevel { Debug, Info, Warn, Error, Off };

const char* to_string(LogLevel level);

/// Parses debug/info/warn/error/off (any case). Throws std::invalid_argument.
LogLevel parse_log_level(std::string_view text);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    bool enabled(LogLevel level) const;

    /// Sink must outlive the logger or be replaced before it is destroyed.
    void set_sink(std::ostream& os);

    void log(LogLevel level, const std::string& message);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex m_mutex;
    std::ostream* m_sink;
    LogLevel m_level{LogLevel::Warn};
};

} // namespace arith

// Streams `expr` into a message only when `level` is enabled.
#define ARITH_LOG(level, expr)                                           \
    do {                                                                 \
        if (::arith::Logger::instance().enabled(level)) {                \
            std::ostringstream arith_log_os_;                            \
            arith_log_os_ << expr;                                       \
            ::arith::Logger::instance().log(level, arith_log_os_.str()); \
        }                                                                \
    } while (0)
