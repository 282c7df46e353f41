#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace sdrelog::core {

// 日志记录使用墙上时钟（与 spdlog::log_clock 相同），时间戳字段由它换算得到。
using clock = std::chrono::system_clock;
using time_point = clock::time_point;

/**
 * @brief ASCII 大小写无关比较（配置值/级别名解析用，不处理 locale）。
 */
[[nodiscard]] constexpr bool ascii_iequals(std::string_view a,
                                           std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        char x = a[i];
        char y = b[i];
        if (x >= 'A' && x <= 'Z') {
            x = static_cast<char>(x - 'A' + 'a');
        }
        if (y >= 'A' && y <= 'Z') {
            y = static_cast<char>(y - 'A' + 'a');
        }
        if (x != y) {
            return false;
        }
    }
    return true;
}

} // namespace sdrelog::core
