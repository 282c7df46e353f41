#include "sdrelog/format/line.hpp"

#include <spdlog/details/os.h>

#include <fmt/format.h>

#include <array>
#include <ctime>
#include <iterator>

namespace sdrelog::format {
namespace {

void append_timestamp_(core::time_point time,
                       const FormatOptions &options,
                       std::string &out) {
    const std::time_t tt = core::clock::to_time_t(time);
    const std::tm tm = options.utc ? spdlog::details::os::gmtime(tt)
                                   : spdlog::details::os::localtime(tt);

    std::array<char, 128> buf{};
    std::size_t n = 0;
    if (!options.time_pattern.empty()) {
        n = std::strftime(buf.data(), buf.size(), options.time_pattern.c_str(), &tm);
    }
    if (n == 0) {
        out.append(kTimestampPlaceholder);
    } else {
        out.append(buf.data(), n);
    }

    if (options.show_millis) {
        const auto since_epoch = time.time_since_epoch();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch)
                      .count() %
                  1000;
        if (ms < 0) {
            ms += 1000;
        }
        fmt::format_to(std::back_inserter(out), ".{:03}", ms);
    }
}

[[nodiscard]] std::string_view basename_(std::string_view path) noexcept {
    const auto pos = path.find_last_of("/\\");
    if (pos == std::string_view::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

} // namespace

void append_line(const Record &record,
                 const FormatOptions &options,
                 bool color,
                 std::string &out) {
    const auto &palette = options.palette;

    // [LEVEL]
    out.push_back('[');
    if (color) {
        out.append(palette.for_level(record.level));
    }
    fmt::format_to(std::back_inserter(out), "{:<5}", core::level_name(record.level));
    if (color) {
        out.append(palette.reset);
    }
    out.push_back(']');

    // [timestamp]
    out.push_back('[');
    if (color) {
        out.append(palette.timestamp);
    }
    append_timestamp_(record.time, options, out);
    if (color) {
        out.append(palette.reset);
    }
    out.push_back(']');

    // [file:line]
    if (options.location != LocationStyle::none) {
        out.push_back('[');
        if (record.file.empty() || record.line <= 0) {
            out.append(kUnknownLocation);
        } else {
            const auto file = options.location == LocationStyle::full
                                  ? record.file
                                  : basename_(record.file);
            fmt::format_to(std::back_inserter(out), "{}:{}", file, record.line);
        }
        out.push_back(']');
    }

    out.push_back(' ');
    out.append(record.message);
}

std::string format_line(const Record &record,
                        const FormatOptions &options,
                        bool color) {
    std::string out;
    out.reserve(64 + record.message.size());
    append_line(record, options, color, out);
    return out;
}

} // namespace sdrelog::format
