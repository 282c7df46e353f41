#pragma once

#include "sdrelog/core/level.hpp"
#include "sdrelog/format/options.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace sdrelog::core {

/**
 * @brief 颜色策略。
 *
 * automatic：仅当目标流是终端且 TERM/COLORTERM 表明支持颜色时输出 ANSI 控制码；
 * 重定向到文件/管道时不输出，避免污染日志文件。
 */
enum class ColorMode : std::uint8_t {
    automatic = 0,
    always = 1,
    never = 2,
};

/**
 * @brief 输出流分配策略。
 *
 * split：trace/debug/info 写 stdout，warn/error 写 stderr。
 */
enum class StreamPolicy : std::uint8_t {
    split = 0,
    stdout_only = 1,
    stderr_only = 2,
};

struct Config final {
    // 阈值：该级别及更严重的级别被输出。
    Level threshold{Level::info};

    ColorMode color{ColorMode::automatic};

    StreamPolicy streams{StreamPolicy::split};

    format::FormatOptions format{};

    // 注册到 spdlog registry 的 logger 名称。
    std::string logger_name{"sdrelog"};
};

std::error_code parse_color_mode(std::string_view text, ColorMode &out) noexcept;
std::error_code parse_stream_policy(std::string_view text, StreamPolicy &out) noexcept;
std::error_code parse_location_style(std::string_view text,
                                     format::LocationStyle &out) noexcept;

/**
 * @brief 解析时区：local -> false，utc/gmt -> true。
 */
std::error_code parse_time_zone(std::string_view text, bool &utc) noexcept;

/**
 * @brief 进程环境里 NO_COLOR 是否存在且非空（https://no-color.org）。
 *
 * ColorMode::automatic 在任何启用路径下都遵守它；always 不受影响。
 */
[[nodiscard]] bool no_color_requested() noexcept;

// 环境变量查询函数：返回 nullptr 表示未设置。
using EnvLookup = std::function<const char *(const char *)>;

/**
 * @brief 用环境变量覆盖 config 中对应字段。
 *
 * 识别的变量：
 * - SDRELOG_LEVEL：级别名或 0..5
 * - SDRELOG_COLOR：auto/always/never；NO_COLOR 存在（非空）时强制 never
 * - SDRELOG_TIME：local/utc
 * - SDRELOG_TIME_FORMAT：strftime 格式串（空串忽略）
 * - SDRELOG_LOCATION：basename/full/none
 * - SDRELOG_STREAMS：split/stdout/stderr
 *
 * 非法取值不会中断处理：对应字段保持原值，其余变量照常应用；
 * 返回遇到的第一个错误。
 */
std::error_code apply_env(Config &config, const EnvLookup &lookup);

// 使用进程环境（std::getenv）。
std::error_code apply_env(Config &config);

} // namespace sdrelog::core
