#pragma once

/**
 * @file log.hpp
 * @brief 日志输出入口：SDRELOG_TRACE/DEBUG/INFO/WARN/ERROR。
 *
 * 用法：
 *
 *   sdrelog::core::enable_logging(sdrelog::core::Level::info);
 *   SDRELOG_INFO("Hello {}!", "World");
 *
 * - 格式串使用 fmt 的 "{}" 语法，编译期检查；
 * - 级别未启用时宏展开为一次原子读，参数表达式不会被求值；
 * - 启用时捕获 __FILE__/__LINE__/函数名并转交 spdlog 默认 logger；
 * - 没有返回值，格式化/写入失败都被吞掉。
 */

#include "sdrelog/core/level.hpp"
#include "sdrelog/core/log.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace sdrelog::core {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(Level level) noexcept;

// spdlog::level::critical 折叠为 error。
[[nodiscard]] Level from_spdlog_level(spdlog::level::level_enum level) noexcept;

/**
 * @brief 当前的 spdlog 默认 logger（enable_logging 之后即本库创建的 logger）。
 *
 * 可能为 nullptr（业务侧调用过 spdlog::set_default_logger(nullptr)）。
 */
[[nodiscard]] spdlog::logger *logger() noexcept;

/**
 * @brief 带显式源码位置的输出（自行携带位置信息的调用方使用）。
 *
 * SDRELOG_* 宏也展开到这里：无参数的调用同样按 fmt 格式串处理（"{{" -> "{"）。
 */
template <typename... Args>
void log(Level level,
         spdlog::source_loc loc,
         spdlog::format_string_t<Args...> fmt,
         Args &&...args) {
    if (!is_enabled(level)) {
        return;
    }
    logger()->log(loc, to_spdlog_level(level), fmt, std::forward<Args>(args)...);
}

} // namespace sdrelog::core

#define SDRELOG_LOG(level, ...)                                                  \
    do {                                                                         \
        if (::sdrelog::core::is_enabled(level)) {                                \
            ::sdrelog::core::log(                                                \
                level,                                                           \
                ::spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION},       \
                __VA_ARGS__);                                                    \
        }                                                                        \
    } while (false)

#define SDRELOG_TRACE(...) SDRELOG_LOG(::sdrelog::core::Level::trace, __VA_ARGS__)
#define SDRELOG_DEBUG(...) SDRELOG_LOG(::sdrelog::core::Level::debug, __VA_ARGS__)
#define SDRELOG_INFO(...) SDRELOG_LOG(::sdrelog::core::Level::info, __VA_ARGS__)
#define SDRELOG_WARN(...) SDRELOG_LOG(::sdrelog::core::Level::warn, __VA_ARGS__)
#define SDRELOG_ERROR(...) SDRELOG_LOG(::sdrelog::core::Level::error, __VA_ARGS__)
