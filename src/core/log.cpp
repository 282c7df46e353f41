#include "sdrelog/core/log.hpp"

#include "sdrelog/log.hpp"
#include "sdrelog/sinks/console_sink.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <system_error>

namespace sdrelog::core {

spdlog::level::level_enum to_spdlog_level(Level level) noexcept {
    switch (level) {
    case Level::trace:
        return spdlog::level::trace;
    case Level::debug:
        return spdlog::level::debug;
    case Level::info:
        return spdlog::level::info;
    case Level::warn:
        return spdlog::level::warn;
    case Level::error:
        return spdlog::level::err;
    case Level::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

Level from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return Level::trace;
    case spdlog::level::debug:
        return Level::debug;
    case spdlog::level::info:
        return Level::info;
    case spdlog::level::warn:
        return Level::warn;
    case spdlog::level::err:
    case spdlog::level::critical:
        return Level::error;
    case spdlog::level::off:
        return Level::off;
    default:
        return Level::off;
    }
}

spdlog::logger *logger() noexcept { return spdlog::default_logger_raw(); }

void enable_logging(Level threshold) {
    Config config;
    config.threshold = threshold;
    enable_logging(config);
}

void enable_logging(const Config &config) { enable_logging(config, stdout, stderr); }

void enable_logging(const Config &config, std::FILE *out, std::FILE *err) {
    auto sink = std::make_shared<sinks::ConsoleSink>(
        config.format, config.color, config.streams, out, err);
    auto logger = std::make_shared<spdlog::logger>(config.logger_name, std::move(sink));
    logger->set_level(to_spdlog_level(config.threshold));

    // 日志不能影响调用方：格式化异常等由 spdlog 捕获后交给这里，直接丢弃。
    logger->set_error_handler([](const std::string &) {});

    spdlog::set_default_logger(std::move(logger));
}

void enable_logging_from_env(Level default_threshold) {
    Config config;
    config.threshold = default_threshold;
    const std::error_code ec = apply_env(config);
    enable_logging(config);
    if (ec) {
        SDRELOG_WARN("ignoring invalid logging environment: {}", ec.message());
    }
}

void disable_logging() noexcept { set_level(Level::off); }

// 业务侧可能通过 spdlog::set_default_logger(nullptr) 移除默认 logger，
// 此时视为全部关闭。
void set_level(Level level) noexcept {
    // 只调整默认 logger；业务侧额外注册的 logger 不受影响。
    if (auto *logger = spdlog::default_logger_raw()) {
        logger->set_level(to_spdlog_level(level));
    }
}

Level current_level() noexcept {
    const auto *logger = spdlog::default_logger_raw();
    if (logger == nullptr) {
        return Level::off;
    }
    return from_spdlog_level(logger->level());
}

bool is_enabled(Level level) noexcept {
    if (level == Level::off) {
        return false;
    }
    const auto *logger = spdlog::default_logger_raw();
    return logger != nullptr && logger->should_log(to_spdlog_level(level));
}

} // namespace sdrelog::core
