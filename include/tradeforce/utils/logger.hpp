#pragma once
// ============================================================================
// TRADEFORCE ENGINE - Logger
// ============================================================================
// Process-wide logging facade over spdlog
// Format strings use fmt "{}" placeholders
// ============================================================================

#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace tradeforce::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

/// Parse "trace", "debug", "info", "warn", "error", "critical", "off"
/// Unknown names map to Info
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool console = true;
    std::string log_file;   // Empty = no file sink
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    // Async logging through spdlog's thread pool
    bool async = false;
    size_t queue_size = 8192;
    int flush_interval_s = 1;

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
    bool rotate_on_open = false;
};

// ============================================================================
// Logger Interface
// ============================================================================

class Logger {
public:
    /// Replace the global sinks according to config
    static void initialize(const LogConfig& config = LogConfig{});

    /// Flush and close all sinks, falling back to a plain console logger
    static void shutdown();

    /// Get the global logger instance
    static Logger& instance();

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    [[nodiscard]] bool should_log(LogLevel level) const;

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args) {
        log(LogLevel::Critical, fmt, std::forward<Args>(args)...);
    }

    /// Write an already formatted message
    void write(LogLevel level, std::string_view message);

    /// Flush all pending logs
    void flush();

private:
    Logger();

    template <typename... Args>
    void log(LogLevel level, std::string_view fmt, Args&&... args) {
        if (!should_log(level)) return;
        write(level, fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...));
    }

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::tradeforce::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::tradeforce::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::tradeforce::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::tradeforce::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::tradeforce::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::tradeforce::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define TRADEFORCE_CONCAT_IMPL(a, b) a##b
#define TRADEFORCE_CONCAT(a, b) TRADEFORCE_CONCAT_IMPL(a, b)
#define SCOPED_TIMER(name) \
    ::tradeforce::utils::ScopedTimer TRADEFORCE_CONCAT(_timer_, __LINE__)(name)

}  // namespace tradeforce::utils
