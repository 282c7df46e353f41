#pragma once

#include "sdrelog/format/options.hpp"

#include <spdlog/formatter.h>

#include <memory>
#include <string>

namespace sdrelog::format {

/**
 * @brief 把 format_line 适配为 spdlog::formatter。
 *
 * 每条消息追加一行（含 '\n'）到 spdlog 的缓冲区。是否着色在构造时确定，
 * 因为同一 formatter 只服务于一个输出流。
 */
class LineFormatter final : public spdlog::formatter {
public:
    explicit LineFormatter(FormatOptions options = {}, bool color = false);

    void format(const spdlog::details::log_msg &msg, spdlog::memory_buf_t &dest) override;
    [[nodiscard]] std::unique_ptr<spdlog::formatter> clone() const override;

    [[nodiscard]] bool color() const noexcept { return color_; }
    [[nodiscard]] const FormatOptions &options() const noexcept { return options_; }

private:
    FormatOptions options_;
    bool color_{false};
    std::string scratch_{};
};

} // namespace sdrelog::format
