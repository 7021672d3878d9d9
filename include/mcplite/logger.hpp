#pragma once
#include "types.hpp"
#include <functional>
#include <string>

namespace mcplite {

using LogSink = std::function<void(LogLevel level, const std::string& logger,
                                   const std::string& message)>;

/// Levelled logger with a replaceable sink. Messages below the threshold, or
/// any message while disabled, are dropped before reaching the sink.
class Logger {
public:
    explicit Logger(std::string name, LogLevel level = LogLevel::Info,
                    bool enabled = true, LogSink sink = nullptr);

    const std::string& name() const { return name_; }

    LogLevel level() const { return level_; }
    void set_level(LogLevel level);

    bool enabled() const { return enabled_; }
    void set_enabled(bool enabled);

    void set_sink(LogSink sink);

    bool should_log(LogLevel level) const;
    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const { log(LogLevel::Debug, message); }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void warning(const std::string& message) const { log(LogLevel::Warning, message); }
    void error(const std::string& message) const { log(LogLevel::Error, message); }

    /// Writes "<timestamp> - <logger> - <LEVEL> - <message>" to stderr.
    static void stderr_sink(LogLevel level, const std::string& logger,
                            const std::string& message);

private:
    std::string name_;
    LogLevel level_;
    bool enabled_;
    LogSink sink_;
};

} // namespace mcplite
