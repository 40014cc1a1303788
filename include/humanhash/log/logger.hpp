#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <mutex>
#include <chrono>
#include <optional>
#include <string_view>

namespace humanhash::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Parse a level name as given on the command line or in HUMANHASH_LOG_LEVEL
/// Accepts "debug", "info", "warn"/"warning" and "error", lowercase only.
constexpr std::optional<level> level_from_string(std::string_view name) noexcept {
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warn" || name == "warning") return level::warning;
    if (name == "error") return level::error;
    return std::nullopt;
}

/// Convert log level to ANSI color code
constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";  // Cyan
        case level::info:    return "\033[32m";  // Green
        case level::warning: return "\033[33m";  // Yellow
        case level::error:   return "\033[31m";  // Red
        default:             return "\033[0m";   // Reset
    }
}

/// Singleton logger class, writes to stderr
class logger {
public:
    /// Get singleton instance
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    /// Set minimum log level
    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    /// Get current minimum log level
    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    /// Enable or disable ANSI colors (off when stderr is not a terminal)
    void set_color(bool enabled) noexcept {
        color_.store(enabled, std::memory_order_relaxed);
    }

    bool color() const noexcept {
        return color_.load(std::memory_order_relaxed);
    }

    /// Check whether a message at @p lvl would be written
    bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Log a message with formatting
    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        const bool colored = color();

        std::lock_guard<std::mutex> lock(mutex_);

        // Format: [TIMESTAMP] [LEVEL] [file:line] message
        fmt::print(stderr,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
            colored ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            file,
            line,
            msg,
            colored ? "\033[0m" : ""
        );
    }

private:
    logger() noexcept : min_level_(level::info), color_(true) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    std::atomic<level> min_level_;
    std::atomic<bool> color_;
    std::mutex mutex_;  // Protect concurrent writes to stderr
};

} // namespace humanhash::log
