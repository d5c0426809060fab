#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace agenteval::eval {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
};

[[nodiscard]] std::string_view log_level_name(LogLevel level);

/**
 * \brief Level-filtered, line-oriented logger handed explicitly to the harness components.
 *
 * Each entry is written as `[yyyy-mm-dd hh:mm:ss.mmm] [LEVEL] [category] message` on its own line.
 * Writes are serialised so evaluator workers can share one instance. The sink must outlive the
 * logger.
 */
class Logger {
public:
    explicit Logger(std::ostream& sink, LogLevel min_level = LogLevel::Info);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    [[nodiscard]] bool enabled(LogLevel level) const;

    void log(LogLevel level, std::string_view category, std::string_view message);

    void debug(std::string_view category, std::string_view message) { log(LogLevel::Debug, category, message); }
    void info(std::string_view category, std::string_view message) { log(LogLevel::Info, category, message); }
    void warn(std::string_view category, std::string_view message) { log(LogLevel::Warn, category, message); }
    void error(std::string_view category, std::string_view message) { log(LogLevel::Error, category, message); }

private:
    std::ostream& sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

}  // namespace agenteval::eval
