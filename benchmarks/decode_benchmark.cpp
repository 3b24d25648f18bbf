// decode_benchmark.cpp
// IexTops decode latency benchmark
// Measures decode_message() per message kind and per Symbol representation

#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "benchmark_utils.hpp"
#include "iextops/iextops.hpp"

namespace {

using namespace iex;
using namespace iex::tops;

constexpr std::array<uint8_t, 42> QUOTE_UPDATE{
    0x51, 0x00, 0xAC, 0x63, 0xC0, 0x20, 0x96, 0x86, 0x6D, 0x14,
    0x5A, 0x49, 0x45, 0x58, 0x54, 0x20, 0x20, 0x20,
    0xE4, 0x25, 0x00, 0x00,
    0x24, 0x1D, 0x0F, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xEC, 0x1D, 0x0F, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xE8, 0x03, 0x00, 0x00};

constexpr std::array<uint8_t, 38> TRADE_REPORT{
    0x54, 0x00, 0xC3, 0xDF, 0xF7, 0x05, 0xA2, 0x86, 0x6D, 0x14,
    0x5A, 0x49, 0x45, 0x58, 0x54, 0x20, 0x20, 0x20,
    0x64, 0x00, 0x00, 0x00,
    0x24, 0x1D, 0x0F, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x96, 0x8F, 0x06, 0x00, 0x00, 0x00, 0x00, 0x00};

constexpr std::array<uint8_t, 10> SYSTEM_EVENT{
    0x53, 0x45, 0x00, 0xA0, 0x99, 0x97, 0xE9, 0x3D, 0xB6, 0x14};

constexpr size_t DEFAULT_ITERATIONS = 1'000'000;
constexpr size_t WARMUP_ITERATIONS = 10'000;

template <TopsSymbol Symbol>
bench::LatencyStats run_decode(ByteSpan input, size_t iterations, double freq_ghz) {
    bench::warmup_icache([&] {
        auto r = decode_message<Symbol>(input);
        bench::do_not_optimize(r);
    }, WARMUP_ITERATIONS);

    std::vector<uint64_t> cycles;
    cycles.reserve(iterations);

    for (size_t i = 0; i < iterations; ++i) {
        const uint64_t start = bench::rdtsc_vm_safe();
        auto r = decode_message<Symbol>(input);
        bench::do_not_optimize(r);
        const uint64_t end = bench::rdtsc_vm_safe();
        if (!r) {
            std::cerr << "decode failed: " << r.error().message() << "\n";
            std::exit(1);
        }
        cycles.push_back(end - start);
    }

    bench::LatencyStats stats;
    stats.compute(cycles, freq_ghz);
    return stats;
}

/// Throughput over a contiguous buffer of back-to-back messages
double run_stream(size_t messages, double freq_ghz) {
    std::vector<uint8_t> feed;
    feed.reserve(messages * QUOTE_UPDATE.size());
    for (size_t i = 0; i < messages; ++i) {
        switch (i % 3) {
            case 0: feed.insert(feed.end(), QUOTE_UPDATE.begin(), QUOTE_UPDATE.end()); break;
            case 1: feed.insert(feed.end(), TRADE_REPORT.begin(), TRADE_REPORT.end()); break;
            default: feed.insert(feed.end(), SYSTEM_EVENT.begin(), SYSTEM_EVENT.end()); break;
        }
    }

    size_t decoded = 0;
    const uint64_t start = bench::rdtsc_vm_safe();
    ByteSpan rest{feed};
    while (!rest.empty()) {
        auto r = decode_message<FixedSymbol>(rest);
        if (!r) break;
        bench::do_not_optimize(r->value);
        rest = r->remaining;
        ++decoded;
    }
    const uint64_t end = bench::rdtsc_vm_safe();

    return bench::cycles_to_ns(end - start, freq_ghz) / static_cast<double>(decoded);
}

} // namespace

int main(int argc, char* argv[]) {
    size_t iterations = DEFAULT_ITERATIONS;
    int core = -1;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-n" || arg == "--iterations") && i + 1 < argc) {
            iterations = std::stoul(argv[++i]);
        } else if ((arg == "-c" || arg == "--core") && i + 1 < argc) {
            core = std::stoi(argv[++i]);
        } else if (arg == "--help") {
            std::cout << "Usage: " << argv[0] << " [-n iterations] [-c core]\n";
            return 0;
        }
    }

    if (core >= 0 && !bench::bind_to_core(core)) {
        std::cerr << "Warning: could not bind to core " << core << "\n";
    }

    std::cout << "IexTops Decode Benchmark\n";
    std::cout << "========================\n";
    std::cout << "Version: " << iex::VERSION.string() << " (TOPS " << iex::TOPS_VERSION << ")\n";
    std::cout << "Platform: " << platform::name() << " / " << platform::compiler_name()
              << " / " << platform::arch_name() << "\n";

    const double freq_ghz = bench::estimate_cpu_freq_ghz();
    std::cout << "CPU frequency: " << std::fixed << std::setprecision(2) << freq_ghz << " GHz\n";

    run_decode<FixedSymbol>(ByteSpan{QUOTE_UPDATE}, iterations, freq_ghz)
        .print("QuoteUpdate / FixedSymbol");
    run_decode<std::string_view>(ByteSpan{QUOTE_UPDATE}, iterations, freq_ghz)
        .print("QuoteUpdate / std::string_view");
    run_decode<std::string>(ByteSpan{QUOTE_UPDATE}, iterations, freq_ghz)
        .print("QuoteUpdate / std::string");
    run_decode<InternedSymbol>(ByteSpan{QUOTE_UPDATE}, iterations, freq_ghz)
        .print("QuoteUpdate / InternedSymbol");
    run_decode<FixedSymbol>(ByteSpan{TRADE_REPORT}, iterations, freq_ghz)
        .print("TradeReport / FixedSymbol");
    run_decode<FixedSymbol>(ByteSpan{SYSTEM_EVENT}, iterations, freq_ghz)
        .print("SystemEvent");

    const double per_message = run_stream(iterations, freq_ghz);
    std::cout << "\nMixed stream: " << std::setprecision(2) << per_message << " ns/message\n";

    return 0;
}
