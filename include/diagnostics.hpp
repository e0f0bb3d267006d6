#pragma once

#include <unistd.h>  // for isatty(), STDERR_FILENO

#include <iostream>
#include <string>

namespace Color {
inline bool supports_color() {
    return isatty(STDERR_FILENO);
}
const std::string reset = "\033[0m";

const std::string red = "\033[31m";
const std::string green = "\033[32m";
const std::string yellow = "\033[33m";
const std::string blue = "\033[34m";
const std::string cyan = "\033[36m";

const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";
}  // namespace Color

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "?";
}

// Accepts the names above (case-sensitive). Unknown names leave `fallback`.
inline LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return fallback;
}

// One line on stderr: "[sandstep:<level>] <tag>: <text>". Callers filter by level.
inline void log_message(LogLevel level, const std::string& tag, const std::string& text) {
    if (level == LogLevel::Off) return;
    const std::string* colour = nullptr;
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug: colour = &Color::bright_black; break;
        case LogLevel::Info: colour = &Color::cyan; break;
        case LogLevel::Warn: colour = &Color::yellow; break;
        default: colour = &Color::bright_red; break;
    }
    bool use_color = Color::supports_color();
    std::cerr << (use_color ? *colour : "")
              << "[sandstep:" << log_level_name(level) << "] " << tag << ": " << text
              << (use_color ? Color::reset : "") << std::endl;
}
