#include "mcplite/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mcplite {

Logger::Logger(std::string name, LogLevel level, bool enabled, LogSink sink)
    : name_(std::move(name)), level_(level), enabled_(enabled),
      sink_(sink ? std::move(sink) : LogSink(&Logger::stderr_sink)) {}

void Logger::set_level(LogLevel level) {
    level_ = level;
    log(LogLevel::Info, "Log level changed to: " + log_level_to_string(level));
}

void Logger::set_enabled(bool enabled) {
    enabled_ = enabled;
    log(LogLevel::Info, "Logging enabled for " + name_);
}

void Logger::set_sink(LogSink sink) {
    sink_ = sink ? std::move(sink) : LogSink(&Logger::stderr_sink);
}

bool Logger::should_log(LogLevel level) const {
    return enabled_ && level >= level_;
}

void Logger::log(LogLevel level, const std::string& message) const {
    if (!should_log(level)) return;
    sink_(level, name_, message);
}

void Logger::stderr_sink(LogLevel level, const std::string& logger,
                         const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &secs);
#else
    localtime_r(&secs, &tm_buf);
#endif

    std::string level_name = log_level_to_string(level);
    std::transform(level_name.begin(), level_name.end(), level_name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::ostringstream line;
    line << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << ','
         << std::setw(3) << std::setfill('0') << millis
         << " - " << logger << " - " << level_name << " - " << message << '\n';
    std::cerr << line.str();
}

} // namespace mcplite
