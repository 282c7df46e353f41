#pragma once

#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace sdrelog::benchmarks {

struct BenchmarkResult {
    std::string_view name;
    std::size_t ops;
    double elapsed_ms;
    double ns_per_op;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

// 防止编译器把结果完全优化掉。
template <typename T>
inline void do_not_optimize(const T &value) {
    asm volatile("" : : "r,m"(value) : "memory");
}

/**
 * @brief 连续执行 func ops 次，重复 rounds 轮取最快一轮。
 *
 * 日志路径单次调用在纳秒级，取最快轮可以排除首次缺页/调度抖动。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t ops,
                          int rounds,
                          Func &&func) {
    using hr_clock = std::chrono::high_resolution_clock;

    double best_ms = 0.0;
    for (int r = 0; r < rounds; ++r) {
        const auto start = hr_clock::now();
        for (std::size_t i = 0; i < ops; ++i) {
            func();
        }
        const auto end = hr_clock::now();
        const double ms =
            std::chrono::duration<double, std::milli>(end - start).count();
        if (r == 0 || ms < best_ms) {
            best_ms = ms;
        }
    }

    const double ns_per_op =
        ops == 0 ? 0.0 : best_ms * 1'000'000.0 / static_cast<double>(ops);
    results().push_back({name, ops, best_ms, ns_per_op});
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(90, '=') << "\n";
    std::cout << "BENCHMARK RESULTS\n";
    std::cout << std::string(90, '=') << "\n";
    std::cout << std::left << std::setw(50) << "Benchmark" << std::setw(12)
              << "Ops" << std::setw(14) << "Time (ms)" << std::setw(14)
              << "ns/op"
              << "\n";
    std::cout << std::string(90, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(50) << result.name << std::setw(12)
                  << result.ops << std::fixed << std::setprecision(3)
                  << std::setw(14) << result.elapsed_ms << std::setprecision(1)
                  << std::setw(14) << result.ns_per_op << "\n";
    }

    std::cout << std::string(90, '=') << "\n\n";
}

} // namespace sdrelog::benchmarks

#define BENCH_RUN(name, ops, rounds, code)                                     \
    ::sdrelog::benchmarks::run_benchmark(name, ops, rounds, [&]() { code; })
