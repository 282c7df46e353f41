#pragma once

#include <system_error>

namespace sdrelog::core {

/**
 * @brief 本库错误码。
 *
 * 约定：
 * - 日志输出路径本身不返回错误（写失败/格式化失败一律吞掉）；
 * - 只有配置解析（级别名、颜色模式、环境变量等）会通过 std::error_code 报告问题。
 */
enum class errc : int {
    ok = 0,
    invalid_level = 1,
    invalid_color_mode = 2,
    invalid_time_zone = 3,
    invalid_stream_policy = 4,
    invalid_location_style = 5,
};

const std::error_category &error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

} // namespace sdrelog::core

namespace std {
template <>
struct is_error_code_enum<sdrelog::core::errc> : true_type {};
} // namespace std
