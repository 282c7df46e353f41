#pragma once

#include "sdrelog/core/config.hpp"
#include "sdrelog/core/level.hpp"

#include <cstdio>

namespace sdrelog::core {

/**
 * @brief 日志开关（级别注册表）。
 *
 * 说明：
 * - 阈值保存在 spdlog 默认 logger 的原子级别里，is_enabled 可在任意线程无锁读取；
 * - enable_logging 创建 ConsoleSink + logger 并设为 spdlog 默认 logger，
 *   之后 SDRELOG_* 宏以及已有的 SPDLOG_* / spdlog::info 调用点都会使用同一格式；
 * - enable_logging 应在进程启动时调用一次，不要与其他线程的日志调用并发
 *   （spdlog::set_default_logger 的约束）；
 * - 本头文件不暴露 spdlog 类型，宏与 spdlog 级别转换见 sdrelog/log.hpp。
 */

// 启用：输出 threshold 及更严重的级别，其余配置取默认值。
void enable_logging(Level threshold = Level::info);

void enable_logging(const Config &config);

// 指定输出流（测试或嵌入场景用）；out/err 可以相同。
void enable_logging(const Config &config, std::FILE *out, std::FILE *err);

/**
 * @brief 读取环境变量后启用。
 *
 * default_threshold 在 SDRELOG_LEVEL 未设置时生效；环境变量非法时仍然启用，
 * 并在启用后以 warn 级别报告一次。
 */
void enable_logging_from_env(Level default_threshold = Level::info);

// 关闭全部输出（阈值设为 off）。
void disable_logging() noexcept;

void set_level(Level level) noexcept;
[[nodiscard]] Level current_level() noexcept;

// level 是否会被输出（off 永远返回 false）。
[[nodiscard]] bool is_enabled(Level level) noexcept;

} // namespace sdrelog::core
