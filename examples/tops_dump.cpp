// tops_dump.cpp
// IexTops example: decode a file of back-to-back TOPS 1.6 messages
// Prints one line per record followed by per-kind totals

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

#include "iextops/iextops.hpp"

namespace {

using namespace iex;
using namespace iex::tops;

struct DumpConfig {
    std::string path;
    size_t chunk_size = 64 * 1024;  // Bytes read per feed()
    size_t limit = 0;               // Stop after this many records (0 = all)
    bool quiet = false;             // Totals only
    bool skip_errors = false;       // Resynchronize past bad messages
    bool verbose = false;           // Debug level logging
};

// ============================================================================
// Formatting
// ============================================================================

/// UTC as YYYY-MM-DD HH:MM:SS.nnnnnnnnn
std::string format_time(Timestamp ts) {
    const std::time_t secs = static_cast<std::time_t>(ts.as_seconds());
    const auto nanos = static_cast<long>(ts.as_nanos() % 1'000'000'000);

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%09ld",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
        tm.tm_hour, tm.tm_min, tm.tm_sec, nanos);
    return buf;
}

struct RecordPrinter {
    std::ostream& out;

    void operator()(const SystemEvent& e) const {
        out << format_time(e.timestamp) << "  SystemEvent       "
            << system_event_name(e.kind) << "\n";
    }

    void operator()(const QuoteUpdate<std::string>& q) const {
        out << format_time(q.timestamp) << "  QuoteUpdate       "
            << std::left << std::setw(8) << q.symbol << std::right << " "
            << std::setw(8) << q.bid_size << " @ " << std::fixed << std::setprecision(4)
            << std::setw(10) << q.bid_price << "  x  "
            << std::setw(10) << q.ask_price << " @ " << std::setw(8) << q.ask_size
            << (q.available ? "" : "  [unavailable]")
            << "  " << market_session_name(q.session) << "\n";
    }

    void operator()(const TradeReport<std::string>& t) const {
        out << format_time(t.timestamp) << "  TradeReport       "
            << std::left << std::setw(8) << t.symbol << std::right << " "
            << std::setw(8) << t.size << " @ " << std::fixed << std::setprecision(4)
            << std::setw(10) << t.price << "  id=" << t.id;
        if (t.sale_condition.intermarket_sweep) out << " F";
        if (t.sale_condition.extended_hours) out << " T";
        if (t.sale_condition.odd_lot) out << " I";
        if (t.sale_condition.trade_through_exempt) out << " 8";
        if (t.sale_condition.single_price) out << " X";
        out << "\n";
    }

    void operator()(const OpaqueMessage& m) const {
        out << "                               " << kind_name(m.kind) << "\n";
    }
};

void print_totals(const StreamStats& stats, uint64_t pending) {
    std::cout << "\nMessage totals\n";
    std::cout << "==============\n";
    for (const auto& layout : MESSAGE_LAYOUTS) {
        std::cout << std::left << std::setw(28) << kind_name(layout.kind)
                  << std::right << std::setw(12) << stats.count(layout.kind) << "\n";
    }
    std::cout << std::string(40, '-') << "\n";
    std::cout << std::left << std::setw(28) << "Total" << std::right
              << std::setw(12) << stats.total() << "\n";
    std::cout << std::left << std::setw(28) << "Bytes decoded" << std::right
              << std::setw(12) << stats.bytes_consumed << "\n";
    std::cout << std::left << std::setw(28) << "Bytes skipped" << std::right
              << std::setw(12) << stats.bytes_discarded << "\n";
    std::cout << std::left << std::setw(28) << "Errors" << std::right
              << std::setw(12) << stats.errors << "\n";
    if (pending > 0) {
        std::cout << std::left << std::setw(28) << "Trailing partial bytes" << std::right
                  << std::setw(12) << pending << "\n";
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <file>\n"
              << "Options:\n"
              << "  -q, --quiet          Print totals only\n"
              << "  -n, --limit <count>  Stop after <count> records\n"
              << "  -k, --skip-errors    Skip malformed messages instead of stopping\n"
              << "  -v, --verbose        Debug logging\n"
              << "  --help               Show this message\n";
}

/// Whole argument must be a decimal count
bool parse_count(std::string_view text, size_t& out) {
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    return ec == std::errc{} && ptr == end && !text.empty();
}

} // namespace

int main(int argc, char* argv[]) {
    DumpConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "-n" || arg == "--limit") {
            if (i + 1 >= argc || !parse_count(argv[++i], config.limit)) {
                std::cerr << "Invalid or missing count for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "-k" || arg == "--skip-errors") {
            config.skip_errors = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            config.path = arg;
        }
    }

    if (config.path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    logging::init(logging::LogConfig{
        .min_level = config.verbose ? logging::Level::Debug : logging::Level::Info});

    std::ifstream in(config.path, std::ios::binary);
    if (!in) {
        IEX_LOG_ERROR("cannot open {}", config.path);
        std::cerr << "Failed to open " << config.path << "\n";
        logging::shutdown();
        return 1;
    }
    IEX_LOG_INFO("decoding {}", config.path);

    StreamDecoder<std::string> decoder{StreamDecoderConfig{
        .initial_capacity = config.chunk_size * 2,
        .max_buffered = config.chunk_size * 4,
        .stop_on_error = !config.skip_errors}};

    RecordPrinter printer{std::cout};
    size_t printed = 0;
    bool done = false;
    int exit_code = 0;
    std::vector<uint8_t> chunk(config.chunk_size);

    while (!done && in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            break;
        }

        if (auto fed = decoder.feed(ByteSpan{chunk.data(), got}); !fed) {
            std::cerr << "Error: " << fed.error().message() << "\n";
            exit_code = 1;
            break;
        }

        auto polled = decoder.poll([&](const Message<std::string>& msg) {
            if (done) {
                return;
            }
            if (!config.quiet) {
                std::visit(printer, msg);
            }
            if (config.limit != 0 && ++printed >= config.limit) {
                done = true;
            }
        });

        if (!polled) {
            const auto& err = polled.error();
            std::cerr << "Error at offset " << err.offset << ": " << err.message()
                      << " (tag 0x" << std::hex << std::setw(2) << std::setfill('0')
                      << static_cast<int>(err.tag) << std::dec << std::setfill(' ') << ")\n";
            exit_code = 1;
            break;
        }
    }

    print_totals(decoder.stats(), decoder.buffered());
    IEX_LOG_INFO("decoded {} messages from {}", decoder.stats().total(), config.path);

    logging::flush();
    logging::shutdown();
    return exit_code;
}
