#pragma once

#include "sdrelog/core/config.hpp"
#include "sdrelog/format/line_formatter.hpp"

#include <spdlog/sinks/base_sink.h>

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>

namespace sdrelog::sinks {

/**
 * @brief 控制台 sink：按级别选择输出流，按流决定是否着色。
 *
 * 说明：
 * - 继承 base_sink<std::mutex>，单行写入在锁内完成，多线程输出不会交错；
 * - 每条消息写完即 fflush，与 spdlog 的 stdout_sink 行为一致；
 * - fwrite/fflush 的失败被忽略（日志输出不能影响调用方）；
 * - 默认使用 LineFormatter；若调用方通过 set_pattern/set_formatter 换了格式，
 *   则两个流都改用该 formatter，且不再插入颜色。
 */
class ConsoleSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    ConsoleSink(format::FormatOptions options,
                core::ColorMode color,
                core::StreamPolicy streams,
                std::FILE *out = stdout,
                std::FILE *err = stderr);

    [[nodiscard]] bool color_enabled(std::FILE *stream) const noexcept;

    /**
     * @brief 颜色判定：always/never 直接生效；automatic 要求目标是彩色终端
     * 且环境里没有 NO_COLOR。
     */
    [[nodiscard]] static bool wants_color(core::ColorMode mode, bool color_terminal) noexcept;

    // 给定级别的消息会写到哪个流。
    [[nodiscard]] std::FILE *stream_for(spdlog::level::level_enum level) const noexcept;

protected:
    void sink_it_(const spdlog::details::log_msg &msg) override;
    void flush_() override;
    void set_formatter_(std::unique_ptr<spdlog::formatter> sink_formatter) override;

private:
    [[nodiscard]] static bool should_color_(core::ColorMode mode, std::FILE *stream) noexcept;

    std::FILE *out_;
    std::FILE *err_;
    core::StreamPolicy streams_;
    format::LineFormatter out_formatter_;
    format::LineFormatter err_formatter_;
    bool custom_formatter_{false};
};

} // namespace sdrelog::sinks
