#include "Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

std::mutex g_log_mutex;
std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};

const char* levelName(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "UNKNOWN";
}

} // namespace

void Logger::setLevel(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel Logger::level() {
    return static_cast<LogLevel>(g_level.load());
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "error") { out = LogLevel::ERROR; return true; }
    if (lowered == "warn" || lowered == "warning") { out = LogLevel::WARN; return true; }
    if (lowered == "info") { out = LogLevel::INFO; return true; }
    if (lowered == "debug") { out = LogLevel::DEBUG; return true; }
    return false;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) > g_level.load())
        return;

    const auto now = std::chrono::system_clock::now();
    const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&now_time, &tm_buf);

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "] ["
         << levelName(level) << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line.str();
}
