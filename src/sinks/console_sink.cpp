#include "sdrelog/sinks/console_sink.hpp"

#include <spdlog/details/os.h>

#include <utility>

namespace sdrelog::sinks {

ConsoleSink::ConsoleSink(format::FormatOptions options,
                         core::ColorMode color,
                         core::StreamPolicy streams,
                         std::FILE *out,
                         std::FILE *err)
    : out_(out),
      err_(err),
      streams_(streams),
      out_formatter_(options, should_color_(color, out)),
      err_formatter_(std::move(options), should_color_(color, err)) {}

bool ConsoleSink::wants_color(core::ColorMode mode, bool color_terminal) noexcept {
    switch (mode) {
    case core::ColorMode::always:
        return true;
    case core::ColorMode::never:
        return false;
    case core::ColorMode::automatic:
        break;
    }
    return color_terminal && !core::no_color_requested();
}

bool ConsoleSink::should_color_(core::ColorMode mode, std::FILE *stream) noexcept {
    // 终端判断与 spdlog ansicolor_sink 的 automatic 模式一致。
    const bool color_terminal = stream != nullptr &&
                                spdlog::details::os::in_terminal(stream) &&
                                spdlog::details::os::is_color_terminal();
    return wants_color(mode, color_terminal);
}

bool ConsoleSink::color_enabled(std::FILE *stream) const noexcept {
    if (custom_formatter_) {
        return false;
    }
    if (stream == err_ && err_ != out_) {
        return err_formatter_.color();
    }
    if (stream == out_) {
        return out_formatter_.color();
    }
    return false;
}

std::FILE *ConsoleSink::stream_for(spdlog::level::level_enum level) const noexcept {
    switch (streams_) {
    case core::StreamPolicy::stdout_only:
        return out_;
    case core::StreamPolicy::stderr_only:
        return err_;
    case core::StreamPolicy::split:
        break;
    }
    return level >= spdlog::level::warn ? err_ : out_;
}

void ConsoleSink::sink_it_(const spdlog::details::log_msg &msg) {
    std::FILE *stream = stream_for(msg.level);
    if (stream == nullptr) {
        return;
    }

    spdlog::memory_buf_t buf;
    if (custom_formatter_) {
        formatter_->format(msg, buf);
    } else if (stream == err_ && err_ != out_) {
        err_formatter_.format(msg, buf);
    } else {
        out_formatter_.format(msg, buf);
    }

    // 写失败（流已关闭、磁盘满等）不上报。
    static_cast<void>(std::fwrite(buf.data(), 1, buf.size(), stream));
    static_cast<void>(std::fflush(stream));
}

void ConsoleSink::flush_() {
    if (out_ != nullptr) {
        static_cast<void>(std::fflush(out_));
    }
    if (err_ != nullptr && err_ != out_) {
        static_cast<void>(std::fflush(err_));
    }
}

void ConsoleSink::set_formatter_(std::unique_ptr<spdlog::formatter> sink_formatter) {
    formatter_ = std::move(sink_formatter);
    custom_formatter_ = true;
}

} // namespace sdrelog::sinks
