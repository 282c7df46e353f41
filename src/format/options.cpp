#include "sdrelog/format/options.hpp"

namespace sdrelog::format {

std::string_view Palette::for_level(core::Level level) const noexcept {
    switch (level) {
    case core::Level::trace:
        return trace;
    case core::Level::debug:
        return debug;
    case core::Level::info:
        return info;
    case core::Level::warn:
        return warn;
    case core::Level::error:
        return error;
    case core::Level::off:
        break;
    }
    return other;
}

} // namespace sdrelog::format
