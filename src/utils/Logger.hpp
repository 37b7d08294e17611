#pragma once

#include <string>

enum class LogLevel { ERROR = 0, WARN = 1, INFO = 2, DEBUG = 3 };

/**
 * Logger
 * ------
 * Process-wide leveled logger. Lines go to stderr as
 *   [YYYY-mm-dd HH:MM:SS] [LEVEL] message
 *
 * Writes are serialized with a mutex so the replica link and the
 * event loop can log from anywhere.
 */
class Logger {
public:
    static void setLevel(LogLevel level);
    static LogLevel level();

    // Accepts "error", "warn", "info", "debug" (case-insensitive).
    static bool parseLevel(const std::string& name, LogLevel& out);

    static void log(LogLevel level, const std::string& message);

    static void error(const std::string& message) { log(LogLevel::ERROR, message); }
    static void warn(const std::string& message)  { log(LogLevel::WARN, message); }
    static void info(const std::string& message)  { log(LogLevel::INFO, message); }
    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
};
