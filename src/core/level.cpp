#include "sdrelog/core/level.hpp"

#include "sdrelog/core/common.hpp"
#include "sdrelog/core/error.hpp"

namespace sdrelog::core {

std::string_view level_name(Level level) noexcept {
    switch (level) {
    case Level::trace:
        return "TRACE";
    case Level::debug:
        return "DEBUG";
    case Level::info:
        return "INFO";
    case Level::warn:
        return "WARN";
    case Level::error:
        return "ERROR";
    case Level::off:
        break;
    }
    return "OTHER";
}

Level level_from_int(int value) noexcept {
    if (value <= 0) {
        return Level::trace;
    }
    if (value >= static_cast<int>(Level::off)) {
        return Level::off;
    }
    return static_cast<Level>(value);
}

Level level_from_verbosity(std::uint8_t verbosity) noexcept {
    switch (verbosity) {
    case 0:
    case 1:
    case 2:
    case 3:
        return Level::error;
    case 4:
        return Level::warn;
    case 5:
        return Level::info;
    case 6:
        return Level::debug;
    case 7:
        return Level::trace;
    default:
        return Level::info;
    }
}

std::error_code parse_level(std::string_view text, Level &out) noexcept {
    struct Alias final {
        std::string_view name;
        Level level;
    };
    static constexpr Alias aliases[] = {
        {"trace", Level::trace}, {"debug", Level::debug},
        {"info", Level::info},   {"warn", Level::warn},
        {"warning", Level::warn}, {"error", Level::error},
        {"err", Level::error},   {"off", Level::off},
        {"none", Level::off},
    };

    for (const auto &alias : aliases) {
        if (ascii_iequals(text, alias.name)) {
            out = alias.level;
            return {};
        }
    }

    // 数字形式只接受单个 0..5，避免 "07" 之类的歧义输入。
    if (text.size() == 1 && text[0] >= '0' && text[0] <= '5') {
        out = static_cast<Level>(text[0] - '0');
        return {};
    }

    return make_error_code(errc::invalid_level);
}

} // namespace sdrelog::core
