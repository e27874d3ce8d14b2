#include "arith/log.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace arith {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "?";
}

LogLevel parse_log_level(std::string_view text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) s += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (s == "debug") return LogLevel::Debug;
    if (s == "info") return LogLevel::Info;
    if (s == "warn" || s == "warning") return LogLevel::Warn;
    if (s == "error") return LogLevel::Error;
    if (s == "off" || s == "none") return LogLevel::Off;
    throw std::invalid_argument("Unknown log level: " + std::string(text));
}

Logger::Logger() : m_sink(&std::clog) {}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_level = level;
}

bool Logger::enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return level != LogLevel::Off && m_level != LogLevel::Off && level >= m_level;
}

void Logger::set_sink(std::ostream& os) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sink = &os;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level == LogLevel::Off || m_level == LogLevel::Off || level < m_level) return;
    *m_sink << "[arith] " << to_string(level) << ": " << message << std::endl;
}

} // namespace arith
