#include "grader_harness/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace {

std::mutex& stderr_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

namespace grader::harness {

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

Logger::Logger(LogCallback callback, LogLevel min_level)
    : callback_(std::move(callback)), min_level_(min_level) {}

void Logger::set_callback(LogCallback callback) {
    callback_ = std::move(callback);
}

void Logger::log(LogLevel level, const std::string& message) const {
    if (level < min_level_) {
        return;
    }
    if (callback_) {
        callback_(message);
        return;
    }
    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << "[" << timestamp() << "] " << to_string(level) << " " << message << std::endl;
}

std::string Logger::timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count();
    return oss.str();
}

}  // namespace grader::harness
