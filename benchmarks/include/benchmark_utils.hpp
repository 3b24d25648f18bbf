/*
    IexTops Benchmark Utilities

    Cycle-accurate timing for decode latency measurements:
    - RDTSC cycle counting
    - CPU core affinity binding
    - Latency statistics
*/

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace iex::bench {

// ============================================================================
// RDTSC Timing
// ============================================================================

/// Uses lfence instead of cpuid to avoid a VM exit on virtualized hosts
[[nodiscard]] inline uint64_t rdtsc_vm_safe() noexcept {
    uint64_t lo, hi;
    asm volatile (
        "lfence\n\t"
        "rdtsc\n\t"
        "lfence\n\t"
        : "=a"(lo), "=d"(hi)
    );
    return (hi << 32) | lo;
}

/// Compiler barrier - prevent reordering around measurements
inline void compiler_barrier() noexcept {
    asm volatile("" ::: "memory");
}

/// Keep the optimizer from discarding a computed value
template <typename T>
inline void do_not_optimize(const T& value) noexcept {
    asm volatile("" : : "r,m"(value) : "memory");
}

/// Estimate CPU frequency in GHz (busy-wait keeps the core at full speed)
[[nodiscard]] inline double estimate_cpu_freq_ghz() noexcept {
    using namespace std::chrono;

    auto start_time = steady_clock::now();
    uint64_t start_cycles = rdtsc_vm_safe();

    while (steady_clock::now() - start_time < milliseconds(100)) {
        asm volatile("pause");
    }

    uint64_t end_cycles = rdtsc_vm_safe();
    auto end_time = steady_clock::now();

    double elapsed_ns = duration<double, std::nano>(end_time - start_time).count();
    return static_cast<double>(end_cycles - start_cycles) / elapsed_ns;
}

[[nodiscard]] inline double cycles_to_ns(uint64_t cycles, double freq_ghz) noexcept {
    return static_cast<double>(cycles) / freq_ghz;
}

// ============================================================================
// CPU Affinity
// ============================================================================

/// Bind current thread to a specific CPU core
[[nodiscard]] inline bool bind_to_core(int core_id) noexcept {
#ifdef __linux__
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id, &cpuset);
    return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
#else
    (void)core_id;
    return false;
#endif
}

// ============================================================================
// Latency Statistics
// ============================================================================

struct LatencyStats {
    double min_ns{0};
    double max_ns{0};
    double mean_ns{0};
    double stddev_ns{0};
    double p50_ns{0};
    double p90_ns{0};
    double p99_ns{0};
    double p999_ns{0};
    size_t count{0};

    /// Compute statistics from a vector of cycle counts (sorts in place)
    void compute(std::vector<uint64_t>& cycles, double freq_ghz) {
        if (cycles.empty()) return;

        count = cycles.size();
        std::sort(cycles.begin(), cycles.end());

        auto to_ns = [freq_ghz](uint64_t c) { return cycles_to_ns(c, freq_ghz); };

        min_ns = to_ns(cycles.front());
        max_ns = to_ns(cycles.back());

        double sum = 0;
        for (auto c : cycles) sum += to_ns(c);
        mean_ns = sum / static_cast<double>(count);

        double sq_sum = 0;
        for (auto c : cycles) {
            double diff = to_ns(c) - mean_ns;
            sq_sum += diff * diff;
        }
        stddev_ns = std::sqrt(sq_sum / static_cast<double>(count));

        p50_ns = to_ns(cycles[count / 2]);
        p90_ns = to_ns(cycles[count * 90 / 100]);
        p99_ns = to_ns(cycles[count * 99 / 100]);
        p999_ns = to_ns(cycles[count * 999 / 1000]);
    }

    void print(const char* name) const {
        std::cout << "\n" << name << " (" << count << " iterations):\n";
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "  Min:    " << std::setw(8) << min_ns << " ns\n";
        std::cout << "  Mean:   " << std::setw(8) << mean_ns << " ns\n";
        std::cout << "  P50:    " << std::setw(8) << p50_ns << " ns\n";
        std::cout << "  P90:    " << std::setw(8) << p90_ns << " ns\n";
        std::cout << "  P99:    " << std::setw(8) << p99_ns << " ns\n";
        std::cout << "  P99.9:  " << std::setw(8) << p999_ns << " ns\n";
        std::cout << "  Max:    " << std::setw(8) << max_ns << " ns\n";
        std::cout << "  StdDev: " << std::setw(8) << stddev_ns << " ns\n";
    }
};

// ============================================================================
// Warmup Utilities
// ============================================================================

/// Warm up instruction cache by running function multiple times
template<typename Func>
inline void warmup_icache(Func&& func, size_t iterations = 10000) {
    for (size_t i = 0; i < iterations; ++i) {
        compiler_barrier();
        func();
        compiler_barrier();
    }
}

} // namespace iex::bench
