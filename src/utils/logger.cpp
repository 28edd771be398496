// ============================================================================
// TRADEFORCE ENGINE - Logger Implementation
// ============================================================================

#include "tradeforce/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <vector>

namespace tradeforce::utils {

namespace {

constexpr const char* LOGGER_NAME = "tradeforce";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:    return spdlog::level::trace;
        case LogLevel::Debug:    return spdlog::level::debug;
        case LogLevel::Info:     return spdlog::level::info;
        case LogLevel::Warn:     return spdlog::level::warn;
        case LogLevel::Error:    return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

std::shared_ptr<spdlog::logger> make_console_logger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

struct Logger::Impl {
    mutable std::mutex mutex;
    std::shared_ptr<spdlog::logger> logger = make_console_logger();

    std::shared_ptr<spdlog::logger> get() const {
        std::lock_guard<std::mutex> lock(mutex);
        return logger;
    }

    void replace(std::shared_ptr<spdlog::logger> next) {
        std::lock_guard<std::mutex> lock(mutex);
        logger = std::move(next);
    }
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::initialize(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file,
            config.max_file_size_mb * 1024 * 1024,
            config.max_files,
            config.rotate_on_open));
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    // Registered so that flush_every reaches it
    spdlog::drop(LOGGER_NAME);
    spdlog::register_logger(logger);
    if (config.flush_interval_s > 0) {
        spdlog::flush_every(std::chrono::seconds(config.flush_interval_s));
    }

    instance().impl_->replace(std::move(logger));
}

void Logger::shutdown() {
    auto& self = instance();
    self.flush();
    spdlog::drop(LOGGER_NAME);
    spdlog::shutdown();
    self.impl_->replace(make_console_logger());
}

void Logger::set_level(LogLevel level) {
    impl_->get()->set_level(to_spdlog(level));
}

bool Logger::should_log(LogLevel level) const {
    return impl_->get()->should_log(to_spdlog(level));
}

void Logger::write(LogLevel level, std::string_view message) {
    impl_->get()->log(to_spdlog(level), message);
}

void Logger::flush() {
    impl_->get()->flush();
}

void ScopedTimer::log_duration(int64_t microseconds) const {
    auto& logger = Logger::instance();
    if (!logger.should_log(level_)) return;
    logger.write(level_, fmt::format("{} took {} us", name_, microseconds));
}

}  // namespace tradeforce::utils
