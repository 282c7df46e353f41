#include "sdrelog/core/config.hpp"

#include "sdrelog/core/common.hpp"
#include "sdrelog/core/error.hpp"

#include <cstdlib>

namespace sdrelog::core {
namespace {

template <class Enum>
struct Alias final {
    std::string_view name;
    Enum value;
};

template <class Enum, std::size_t N>
[[nodiscard]] bool lookup_alias_(const Alias<Enum> (&aliases)[N],
                                 std::string_view text,
                                 Enum &out) noexcept {
    for (const auto &alias : aliases) {
        if (ascii_iequals(text, alias.name)) {
            out = alias.value;
            return true;
        }
    }
    return false;
}

// 记录第一个错误，后续错误不覆盖。
void keep_first_(std::error_code &first, std::error_code ec) noexcept {
    if (ec && !first) {
        first = ec;
    }
}

} // namespace

std::error_code parse_color_mode(std::string_view text, ColorMode &out) noexcept {
    static constexpr Alias<ColorMode> aliases[] = {
        {"auto", ColorMode::automatic},
        {"automatic", ColorMode::automatic},
        {"always", ColorMode::always},
        {"on", ColorMode::always},
        {"never", ColorMode::never},
        {"off", ColorMode::never},
    };
    if (lookup_alias_(aliases, text, out)) {
        return {};
    }
    return make_error_code(errc::invalid_color_mode);
}

std::error_code parse_stream_policy(std::string_view text, StreamPolicy &out) noexcept {
    static constexpr Alias<StreamPolicy> aliases[] = {
        {"split", StreamPolicy::split},
        {"stdout", StreamPolicy::stdout_only},
        {"stderr", StreamPolicy::stderr_only},
    };
    if (lookup_alias_(aliases, text, out)) {
        return {};
    }
    return make_error_code(errc::invalid_stream_policy);
}

std::error_code parse_location_style(std::string_view text,
                                     format::LocationStyle &out) noexcept {
    static constexpr Alias<format::LocationStyle> aliases[] = {
        {"basename", format::LocationStyle::basename},
        {"short", format::LocationStyle::basename},
        {"full", format::LocationStyle::full},
        {"none", format::LocationStyle::none},
    };
    if (lookup_alias_(aliases, text, out)) {
        return {};
    }
    return make_error_code(errc::invalid_location_style);
}

std::error_code parse_time_zone(std::string_view text, bool &utc) noexcept {
    static constexpr Alias<bool> aliases[] = {
        {"local", false},
        {"utc", true},
        {"gmt", true},
    };
    if (lookup_alias_(aliases, text, utc)) {
        return {};
    }
    return make_error_code(errc::invalid_time_zone);
}

bool no_color_requested() noexcept {
    const char *v = std::getenv("NO_COLOR");
    return v != nullptr && *v != '\0';
}

std::error_code apply_env(Config &config, const EnvLookup &lookup) {
    std::error_code first;

    if (const char *v = lookup("SDRELOG_LEVEL")) {
        keep_first_(first, parse_level(v, config.threshold));
    }

    if (const char *v = lookup("SDRELOG_COLOR")) {
        keep_first_(first, parse_color_mode(v, config.color));
    }
    // https://no-color.org：存在且非空即关闭颜色，优先级高于 SDRELOG_COLOR。
    if (const char *v = lookup("NO_COLOR"); v != nullptr && *v != '\0') {
        config.color = ColorMode::never;
    }

    if (const char *v = lookup("SDRELOG_TIME")) {
        keep_first_(first, parse_time_zone(v, config.format.utc));
    }

    if (const char *v = lookup("SDRELOG_TIME_FORMAT"); v != nullptr && *v != '\0') {
        config.format.time_pattern = v;
    }

    if (const char *v = lookup("SDRELOG_LOCATION")) {
        keep_first_(first, parse_location_style(v, config.format.location));
    }

    if (const char *v = lookup("SDRELOG_STREAMS")) {
        keep_first_(first, parse_stream_policy(v, config.streams));
    }

    return first;
}

std::error_code apply_env(Config &config) {
    return apply_env(config, [](const char *name) -> const char * {
        return std::getenv(name);
    });
}

} // namespace sdrelog::core
