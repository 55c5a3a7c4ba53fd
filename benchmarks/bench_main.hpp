#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace bsonc::benchmarks {

struct BenchmarkResult {
    std::string name;
    std::size_t bytes_per_op;
    std::size_t ops;
    double avg_us;
    double best_us;
    double throughput_mbps;
};

class Stopwatch {
public:
    Stopwatch() : start_(clock::now()) {}

    [[nodiscard]] double elapsed_us() const {
        const auto d = std::chrono::duration_cast<std::chrono::nanoseconds>(
            clock::now() - start_);
        return static_cast<double>(d.count()) / 1'000.0;
    }

private:
    using clock = std::chrono::steady_clock;
    clock::time_point start_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

/**
 * @brief 运行一项基准：func 执行 ops 次，记录平均与最好单次耗时（微秒）。
 *
 * bytes_per_op 为单次操作处理的字节数，用于换算吞吐；为 0 时不计算吞吐。
 */
template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t bytes_per_op,
                          std::size_t ops,
                          Func &&func) {
    if (ops == 0) {
        return;
    }

    // 预热一次，避免首次分配计入结果
    func();

    double total_us = 0.0;
    double best_us = 0.0;
    for (std::size_t i = 0; i < ops; ++i) {
        Stopwatch sw;
        func();
        const double t = sw.elapsed_us();
        total_us += t;
        best_us = (i == 0) ? t : std::min(best_us, t);
    }
    const double avg_us = total_us / static_cast<double>(ops);

    double throughput_mbps = 0.0;
    if (avg_us > 0.0 && bytes_per_op != 0) {
        const double mb = static_cast<double>(bytes_per_op) / (1024.0 * 1024.0);
        throughput_mbps = mb / (avg_us / 1'000'000.0);
    }

    results().push_back({std::string(name), bytes_per_op, ops, avg_us, best_us,
                         throughput_mbps});
}

inline std::string format_size(std::size_t n) {
    if (n >= 1024 * 1024) {
        return std::to_string(n / (1024 * 1024)) + " MB";
    }
    if (n >= 1024) {
        return std::to_string(n / 1024) + " KB";
    }
    return std::to_string(n) + " B";
}

inline void print_results() {
    std::cout << "\n" << std::string(104, '=') << "\n";
    std::cout << std::left << std::setw(48) << "Benchmark" << std::setw(12)
              << "Bytes/op" << std::setw(10) << "Ops" << std::setw(12)
              << "Avg (us)" << std::setw(12) << "Best (us)"
              << "MB/s\n";
    std::cout << std::string(104, '-') << "\n";

    for (const auto &r : results()) {
        std::cout << std::left << std::setw(48) << r.name << std::setw(12)
                  << format_size(r.bytes_per_op) << std::setw(10) << r.ops
                  << std::fixed << std::setprecision(2) << std::setw(12)
                  << r.avg_us << std::setw(12) << r.best_us;
        if (r.throughput_mbps > 0.0) {
            std::cout << r.throughput_mbps;
        } else {
            std::cout << "-";
        }
        std::cout << "\n";
    }

    std::cout << std::string(104, '=') << "\n\n";
}

} // namespace bsonc::benchmarks

#define BENCH_RUN(name, size, ops, code)                                       \
    ::bsonc::benchmarks::run_benchmark(name, size, ops, [&]() { code; })
