#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace grader::harness {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/**
 * \brief Small callback-based logger shared by every harness component.
 *
 * Components keep a Logger by value and expose set_log_callback() so that the
 * CLI, tests or an embedding application can redirect the output. Without a
 * callback, lines go to std::cerr as "[HH:MM:SS.mmm] LEVEL message".
 */
class Logger {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    Logger() = default;
    explicit Logger(LogCallback callback, LogLevel min_level = LogLevel::Info);

    void set_callback(LogCallback callback);
    void set_min_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const { log(LogLevel::Debug, message); }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void warn(const std::string& message) const { log(LogLevel::Warn, message); }
    void error(const std::string& message) const { log(LogLevel::Error, message); }

    /// Wall-clock time of day formatted as HH:MM:SS.mmm.
    static std::string timestamp();

private:
    LogCallback callback_;
    LogLevel min_level_{LogLevel::Info};
};

}  // namespace grader::harness
