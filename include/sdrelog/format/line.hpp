#pragma once

#include "sdrelog/core/common.hpp"
#include "sdrelog/core/level.hpp"
#include "sdrelog/format/options.hpp"

#include <string>
#include <string_view>

namespace sdrelog::format {

// 时间戳无法表示（strftime 失败/格式串为空）时的占位文本。
inline constexpr std::string_view kTimestampPlaceholder = "????-\?\?-\?\?T\?\?:\?\?:\?\?";

// 无源码位置信息时的占位文本。
inline constexpr std::string_view kUnknownLocation = "<unknown>";

/**
 * @brief 一条日志记录（仅在一次输出调用内存在，不持有任何字符串）。
 */
struct Record final {
    core::Level level{core::Level::info};
    core::time_point time{};
    std::string_view file{};
    int line{0};
    std::string_view message{};
};

/**
 * @brief 渲染一行日志（不含换行符）：
 *
 *   [INFO ][2021-08-22T15:49:01][main.cpp:42] Hello World!
 *
 * - 级别名左对齐补齐到 5 列；color 为 true 时用调色板包裹标签与时间戳；
 * - 消息原样追加，不做转义/截断；
 * - 纯函数，不抛异常，不会失败（无法表示的字段使用占位文本）。
 */
[[nodiscard]] std::string format_line(const Record &record,
                                      const FormatOptions &options,
                                      bool color);

/**
 * @brief 与 format_line 相同，但追加到 out（便于复用缓冲区）。
 */
void append_line(const Record &record,
                 const FormatOptions &options,
                 bool color,
                 std::string &out);

} // namespace sdrelog::format
