#include "bench_main.hpp"

#include "sdrelog/format/line.hpp"
#include "sdrelog/log.hpp"

#include <cstdio>
#include <string>

using namespace sdrelog;

static void bench_format_line() {
    format::FormatOptions options;
    format::Record record;
    record.level = core::Level::info;
    record.time = core::clock::now();
    record.file = "/src/decoder/acars.cpp";
    record.line = 128;
    record.message = "decoded frame: tail=N12345 label=H1 len=220";

    std::string out;
    BENCH_RUN("format_line: plain", 200'000, 5, {
        out.clear();
        format::append_line(record, options, false, out);
        benchmarks::do_not_optimize(out.size());
    });

    BENCH_RUN("format_line: colored", 200'000, 5, {
        out.clear();
        format::append_line(record, options, true, out);
        benchmarks::do_not_optimize(out.size());
    });
}

static void bench_macros() {
    std::FILE *sink = std::fopen("/dev/null", "w");
    if (sink == nullptr) {
        std::fprintf(stderr, "cannot open /dev/null\n");
        return;
    }

    core::Config config;
    config.threshold = core::Level::info;
    config.color = core::ColorMode::never;
    core::enable_logging(config, sink, sink);

    int value = 0;
    // 未启用：只有一次原子读
    BENCH_RUN("SDRELOG_DEBUG (disabled)", 1'000'000, 5, {
        SDRELOG_DEBUG("value {}", ++value);
    });
    BENCH_RUN("SDRELOG_INFO (enabled, /dev/null)", 100'000, 5, {
        SDRELOG_INFO("value {}", ++value);
    });
    benchmarks::do_not_optimize(value);

    spdlog::set_default_logger(nullptr);
    std::fclose(sink);
}

int main() {
    bench_format_line();
    bench_macros();
    sdrelog::benchmarks::print_results();
    return 0;
}
