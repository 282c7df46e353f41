#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace sdrelog::core {

/**
 * @brief 日志级别，按详细程度全序：trace < debug < info < warn < error。
 *
 * off 不是可输出的级别，只作为阈值使用（阈值为 off 时一切输出被关闭）。
 * 底层整数值 0..5 与 level_from_int 的输入一一对应。
 */
enum class Level : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    off = 5,
};

/**
 * @brief 级别显示名（大写，"TRACE"/"DEBUG"/"INFO"/"WARN"/"ERROR"）。
 *
 * off 或越界值返回 "OTHER"。
 */
[[nodiscard]] std::string_view level_name(Level level) noexcept;

/**
 * @brief 整数 -> 级别：0..5 直接映射；小于 0 视为 trace，大于 5 视为 off。
 */
[[nodiscard]] Level level_from_int(int value) noexcept;

/**
 * @brief 内核风格的详细度 -> 级别阈值。
 *
 * 0..3 为各类错误级别（统一为 error），4 为 warn，5 为 info，6 为 debug，
 * 7 为 trace；其余值一律回落到 info。
 */
[[nodiscard]] Level level_from_verbosity(std::uint8_t verbosity) noexcept;

/**
 * @brief 解析级别名（大小写无关）或十进制数字 0..5。
 *
 * 接受 trace/debug/info/warn/warning/error/err/off/none。
 * 失败返回 core::errc::invalid_level，out 保持不变。
 */
std::error_code parse_level(std::string_view text, Level &out) noexcept;

} // namespace sdrelog::core
