#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "iextops/tops/codecs/opaque_message.hpp"
#include "iextops/tops/codecs/quote_update.hpp"
#include "iextops/tops/codecs/system_event.hpp"
#include "iextops/tops/codecs/trade_report.hpp"

using namespace iex;
using namespace iex::tops;
using Catch::Matchers::WithinRel;

namespace {

// Quote update for ZIEXT: 9700 @ 99.05 x 99.07 @ 1000
constexpr std::array<uint8_t, 42> QUOTE_UPDATE{
    0x51, 0x00, 0xAC, 0x63, 0xC0, 0x20, 0x96, 0x86, 0x6D, 0x14,
    0x5A, 0x49, 0x45, 0x58, 0x54, 0x20, 0x20, 0x20,
    0xE4, 0x25, 0x00, 0x00,
    0x24, 0x1D, 0x0F, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xEC, 0x1D, 0x0F, 0x00, 0x00, 0x00, 0x00, 0x00,
    0xE8, 0x03, 0x00, 0x00};

// Trade report for ZIEXT: 100 @ 99.05, trade id 429974
constexpr std::array<uint8_t, 38> TRADE_REPORT{
    0x54, 0x00, 0xC3, 0xDF, 0xF7, 0x05, 0xA2, 0x86, 0x6D, 0x14,
    0x5A, 0x49, 0x45, 0x58, 0x54, 0x20, 0x20, 0x20,
    0x64, 0x00, 0x00, 0x00,
    0x24, 0x1D, 0x0F, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x96, 0x8F, 0x06, 0x00, 0x00, 0x00, 0x00, 0x00};

// End of system hours, 2017-04-17 17:00:00 UTC
constexpr std::array<uint8_t, 10> SYSTEM_EVENT{
    0x53, 0x45, 0x00, 0xA0, 0x99, 0x97, 0xE9, 0x3D, 0xB6, 0x14};

template <std::size_t N>
std::vector<uint8_t> copy_of(const std::array<uint8_t, N>& bytes) {
    return {bytes.begin(), bytes.end()};
}

std::vector<uint8_t> zero_body_message(uint8_t tag, std::size_t body_length) {
    std::vector<uint8_t> msg(1 + body_length, 0);
    msg[0] = tag;
    return msg;
}

} // namespace

// ============================================================================
// QuoteUpdateCodec Tests
// ============================================================================

TEST_CASE("QuoteUpdate reference message", "[codec][quote]") {
    auto result = QuoteUpdateCodec::decode<std::string>(ByteSpan{QUOTE_UPDATE});
    REQUIRE(result.has_value());

    const auto& q = result->value;
    REQUIRE(q.available);
    REQUIRE(q.session == MarketSession::Regular);
    REQUIRE(q.timestamp.as_nanos() == 1471980632572715948LL);
    REQUIRE(q.symbol == "ZIEXT");
    REQUIRE(q.bid_size == 9700);
    REQUIRE_THAT(q.bid_price, WithinRel(99.05, 1e-12));
    REQUIRE(q.ask_size == 1000);
    REQUIRE_THAT(q.ask_price, WithinRel(99.07, 1e-12));
    REQUIRE(result->remaining.empty());
}

TEST_CASE("QuoteUpdate flags", "[codec][quote][flags]") {
    auto bytes = copy_of(QUOTE_UPDATE);

    SECTION("Symbol not available") {
        bytes[QuoteUpdateCodec::Offset::Flags] = 0x80;
        auto result = QuoteUpdateCodec::decode<std::string>(ByteSpan{bytes});
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->value.available);
        REQUIRE(result->value.session == MarketSession::Regular);
    }

    SECTION("Out of hours") {
        bytes[QuoteUpdateCodec::Offset::Flags] = 0x40;
        auto result = QuoteUpdateCodec::decode<std::string>(ByteSpan{bytes});
        REQUIRE(result.has_value());
        REQUIRE(result->value.available);
        REQUIRE(result->value.session == MarketSession::OutOfHours);
        REQUIRE(market_session_name(result->value.session) == "OutOfHours");
    }

    SECTION("Reserved bit set") {
        bytes[QuoteUpdateCodec::Offset::Flags] = 0x01;
        auto result = QuoteUpdateCodec::decode<std::string>(ByteSpan{bytes});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == DecodeErrorCode::ReservedBitsSet);
        REQUIRE(result.error().is_malformed());
        REQUIRE(result.error().tag == QuoteUpdateCodec::TAG);
        REQUIRE(result.error().offset == QuoteUpdateCodec::Offset::Flags);
    }

    SECTION("Valid flags with a reserved bit") {
        bytes[QuoteUpdateCodec::Offset::Flags] = 0xC0 | 0x20;
        REQUIRE_FALSE(QuoteUpdateCodec::decode<std::string>(ByteSpan{bytes}).has_value());
    }
}

TEST_CASE("QuoteUpdate framing", "[codec][quote]") {
    SECTION("Trailing bytes are returned") {
        auto bytes = copy_of(QUOTE_UPDATE);
        bytes.push_back(0x53);
        bytes.push_back(0x45);
        auto result = QuoteUpdateCodec::decode<std::string>(ByteSpan{bytes});
        REQUIRE(result.has_value());
        REQUIRE(result->remaining.size() == 2);
        REQUIRE(result->remaining[0] == 0x53);
    }

    SECTION("Short body is incomplete") {
        auto result = QuoteUpdateCodec::decode<std::string>(ByteSpan{QUOTE_UPDATE}.first(41));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_incomplete());
        REQUIRE(result.error().offset == 41);
        REQUIRE(result.error().required == 42);
    }

    SECTION("Wrong tag") {
        auto result = QuoteUpdateCodec::decode<std::string>(ByteSpan{TRADE_REPORT});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_unrecognized());
        REQUIRE_FALSE(QuoteUpdateCodec::matches(ByteSpan{TRADE_REPORT}));
    }
}

TEST_CASE("QuoteUpdate symbol representations", "[codec][quote][symbol]") {
    SECTION("Borrowed view into the input") {
        auto result = QuoteUpdateCodec::decode<std::string_view>(ByteSpan{QUOTE_UPDATE});
        REQUIRE(result.has_value());
        REQUIRE(result->value.symbol == "ZIEXT");
        REQUIRE(reinterpret_cast<const uint8_t*>(result->value.symbol.data()) ==
                QUOTE_UPDATE.data() + QuoteUpdateCodec::Offset::Symbol);
    }

    SECTION("Inline fixed symbol") {
        auto result = QuoteUpdateCodec::decode<FixedSymbol>(ByteSpan{QUOTE_UPDATE});
        REQUIRE(result.has_value());
        REQUIRE(result->value.symbol == std::string_view{"ZIEXT"});
    }

    SECTION("Interned symbol") {
        auto a = QuoteUpdateCodec::decode<InternedSymbol>(ByteSpan{QUOTE_UPDATE});
        auto b = QuoteUpdateCodec::decode<InternedSymbol>(ByteSpan{QUOTE_UPDATE});
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->value.symbol.id() == b->value.symbol.id());
        REQUIRE(a->value.symbol.view() == "ZIEXT");
    }
}

// ============================================================================
// TradeReportCodec Tests
// ============================================================================

TEST_CASE("TradeReport reference message", "[codec][trade]") {
    auto result = TradeReportCodec::decode<std::string>(ByteSpan{TRADE_REPORT});
    REQUIRE(result.has_value());

    const auto& t = result->value;
    REQUIRE(t.sale_condition == SaleCondition{});
    REQUIRE(t.timestamp.as_nanos() == 1471980683662974915LL);
    REQUIRE(t.symbol == "ZIEXT");
    REQUIRE(t.size == 100);
    REQUIRE_THAT(t.price, WithinRel(99.05, 1e-12));
    REQUIRE(t.id == 429974);
    REQUIRE(result->remaining.empty());
}

TEST_CASE("TradeReport sale condition", "[codec][trade][flags]") {
    auto bytes = copy_of(TRADE_REPORT);

    SECTION("Flag order") {
        struct Case {
            uint8_t raw;
            SaleCondition expected;
        };
        const std::array<Case, 5> cases{{
            {0x80, {.intermarket_sweep = true}},
            {0x40, {.extended_hours = true}},
            {0x20, {.odd_lot = true}},
            {0x10, {.trade_through_exempt = true}},
            {0x08, {.single_price = true}},
        }};

        for (const auto& c : cases) {
            bytes[TradeReportCodec::Offset::SaleCondition] = c.raw;
            auto result = TradeReportCodec::decode<std::string>(ByteSpan{bytes});
            REQUIRE(result.has_value());
            REQUIRE(result->value.sale_condition == c.expected);
        }
    }

    SECTION("All conditions") {
        bytes[TradeReportCodec::Offset::SaleCondition] = 0xF8;
        auto result = TradeReportCodec::decode<std::string>(ByteSpan{bytes});
        REQUIRE(result.has_value());
        const auto& sc = result->value.sale_condition;
        REQUIRE(sc.intermarket_sweep);
        REQUIRE(sc.extended_hours);
        REQUIRE(sc.odd_lot);
        REQUIRE(sc.trade_through_exempt);
        REQUIRE(sc.single_price);
    }

    SECTION("Reserved bits set") {
        for (uint8_t raw : {uint8_t{0x04}, uint8_t{0x02}, uint8_t{0x01}}) {
            bytes[TradeReportCodec::Offset::SaleCondition] = raw;
            auto result = TradeReportCodec::decode<std::string>(ByteSpan{bytes});
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().code == DecodeErrorCode::ReservedBitsSet);
            REQUIRE(result.error().tag == TradeReportCodec::TAG);
            REQUIRE(result.error().offset == TradeReportCodec::Offset::SaleCondition);
        }
    }
}

TEST_CASE("TradeReport short input", "[codec][trade]") {
    for (std::size_t len = 1; len < TradeReportCodec::TOTAL_SIZE; ++len) {
        auto result = TradeReportCodec::decode<std::string>(ByteSpan{TRADE_REPORT}.first(len));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_incomplete());
    }
}

// ============================================================================
// SystemEventCodec Tests
// ============================================================================

TEST_CASE("SystemEvent reference message", "[codec][system]") {
    auto result = SystemEventCodec::decode(ByteSpan{SYSTEM_EVENT});
    REQUIRE(result.has_value());
    REQUIRE(result->value.kind == SystemEventKind::EndOfSystemHours);
    REQUIRE(result->value.timestamp.as_nanos() == 1492448400000000000LL);
    REQUIRE(result->remaining.empty());
}

TEST_CASE("SystemEvent codes", "[codec][system]") {
    auto bytes = copy_of(SYSTEM_EVENT);

    SECTION("Every known code") {
        struct Case {
            char code;
            SystemEventKind kind;
        };
        const std::array<Case, 6> cases{{
            {'O', SystemEventKind::StartOfMessages},
            {'S', SystemEventKind::StartOfSystemHours},
            {'R', SystemEventKind::StartOfRegularHours},
            {'M', SystemEventKind::EndOfRegularHours},
            {'E', SystemEventKind::EndOfSystemHours},
            {'C', SystemEventKind::EndOfMessages},
        }};

        for (const auto& c : cases) {
            bytes[SystemEventCodec::Offset::EventCode] = static_cast<uint8_t>(c.code);
            auto result = SystemEventCodec::decode(ByteSpan{bytes});
            REQUIRE(result.has_value());
            REQUIRE(result->value.kind == c.kind);
        }
    }

    SECTION("Unknown code is malformed") {
        bytes[SystemEventCodec::Offset::EventCode] = 'X';
        auto result = SystemEventCodec::decode(ByteSpan{bytes});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == DecodeErrorCode::UnknownSystemEvent);
        REQUIRE(result.error().is_malformed());
        REQUIRE(result.error().offset == SystemEventCodec::Offset::EventCode);
    }

    SECTION("Names") {
        REQUIRE(system_event_name(SystemEventKind::StartOfRegularHours) == "StartOfRegularHours");
        REQUIRE(to_system_event_kind('Z') == std::nullopt);
    }
}

TEST_CASE("SystemEvent is constexpr", "[codec][system]") {
    STATIC_REQUIRE(SystemEventCodec::decode(ByteSpan{SYSTEM_EVENT})->value.kind ==
                   SystemEventKind::EndOfSystemHours);
}

// ============================================================================
// Opaque Codec Tests
// ============================================================================

TEST_CASE("Opaque messages", "[codec][opaque]") {
    for (const auto& layout : MESSAGE_LAYOUTS) {
        if (!layout.opaque) {
            continue;
        }
        CAPTURE(kind_name(layout.kind));

        auto msg = zero_body_message(layout.tag, layout.body_length);
        msg.push_back(0x99);

        auto result = decode_opaque(layout, ByteSpan{msg});
        REQUIRE(result.has_value());
        REQUIRE(result->value.kind == layout.kind);
        REQUIRE(result->remaining.size() == 1);

        auto short_result = decode_opaque(layout, ByteSpan{msg}.first(layout.body_length));
        REQUIRE_FALSE(short_result.has_value());
        REQUIRE(short_result.error().is_incomplete());
    }
}

TEST_CASE("Opaque codec aliases", "[codec][opaque]") {
    SECTION("Auction information") {
        auto msg = zero_body_message(tag::AuctionInformation, 79);
        auto result = AuctionInformationCodec::decode(ByteSpan{msg});
        REQUIRE(result.has_value());
        REQUIRE(result->value == OpaqueMessage{MessageKind::AuctionInformation});
        REQUIRE(result->remaining.empty());
    }

    SECTION("Operational halt body is not inspected") {
        auto msg = zero_body_message(tag::OperationalHaltStatus, 17);
        for (std::size_t i = 1; i < msg.size(); ++i) {
            msg[i] = 0xFF;
        }
        auto result = OperationalHaltStatusCodec::decode(ByteSpan{msg});
        REQUIRE(result.has_value());
        REQUIRE(result->value.kind == MessageKind::OperationalHaltStatus);
    }

    SECTION("Security directory with the wrong tag") {
        auto msg = zero_body_message(tag::TradingStatus, 30);
        auto result = SecurityDirectoryCodec::decode(ByteSpan{msg});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_unrecognized());
    }
}
