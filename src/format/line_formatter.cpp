#include "sdrelog/format/line_formatter.hpp"

#include "sdrelog/log.hpp"
#include "sdrelog/format/line.hpp"

#include <spdlog/details/log_msg.h>

#include <string_view>
#include <utility>

namespace sdrelog::format {

LineFormatter::LineFormatter(FormatOptions options, bool color)
    : options_(std::move(options)), color_(color) {}

void LineFormatter::format(const spdlog::details::log_msg &msg,
                           spdlog::memory_buf_t &dest) {
    Record record;
    record.level = core::from_spdlog_level(msg.level);
    record.time = msg.time;
    if (!msg.source.empty() && msg.source.filename != nullptr) {
        record.file = msg.source.filename;
        record.line = msg.source.line;
    }
    record.message = std::string_view(msg.payload.data(), msg.payload.size());

    // scratch_ 在多次调用间复用，sink 的互斥锁保证这里不会并发进入。
    scratch_.clear();
    append_line(record, options_, color_, scratch_);
    scratch_.push_back('\n');
    dest.append(scratch_.data(), scratch_.data() + scratch_.size());
}

std::unique_ptr<spdlog::formatter> LineFormatter::clone() const {
    return std::make_unique<LineFormatter>(options_, color_);
}

} // namespace sdrelog::format
