#pragma once

#include "sdrelog/core/level.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace sdrelog::format {

/**
 * @brief ANSI 调色板。
 *
 * 默认值：级别标签统一加粗，trace 品红、debug 青、info 绿、warn 黄、error 红；
 * 时间戳使用 24bit 橙褐色 (159,80,1)。字段是普通字符串，可整体替换。
 */
struct Palette final {
    std::string trace{"\033[1;35m"};
    std::string debug{"\033[1;36m"};
    std::string info{"\033[1;32m"};
    std::string warn{"\033[1;33m"};
    std::string error{"\033[1;31m"};
    std::string other{"\033[1m"};
    std::string timestamp{"\033[1;38;2;159;80;1m"};
    std::string reset{"\033[0m"};

    [[nodiscard]] std::string_view for_level(core::Level level) const noexcept;
};

// 源码位置的显示方式。
enum class LocationStyle : std::uint8_t {
    basename = 0, // 仅文件名：main.cpp:42
    full = 1,     // 编译器给出的完整路径
    none = 2,     // 不输出位置字段
};

struct FormatOptions final {
    // strftime 格式串。
    std::string time_pattern{"%Y-%m-%dT%H:%M:%S"};

    // true 使用 UTC，false 使用本地时区。
    bool utc{false};

    // 是否在时间戳后追加 ".mmm" 毫秒。
    bool show_millis{false};

    LocationStyle location{LocationStyle::basename};

    Palette palette{};
};

} // namespace sdrelog::format
