#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "iextops/tops/decoder.hpp"

using namespace iex;
using namespace iex::tops;

namespace {

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

std::vector<uint8_t> zero_body_message(const MessageLayout& layout) {
    std::vector<uint8_t> msg(layout.total_size(), 0);
    msg[0] = layout.tag;
    return msg;
}

} // namespace

// ============================================================================
// Reference Scenarios
// ============================================================================

TEST_CASE("Decode quote update", "[decoder][reference]") {
    auto result = decode_message<std::string>(ByteSpan{QUOTE_UPDATE});
    REQUIRE(result.has_value());
    REQUIRE(result->remaining.empty());
    REQUIRE(message_kind(result->value) == MessageKind::QuoteUpdate);

    const auto* q = std::get_if<QuoteUpdate<std::string>>(&result->value);
    REQUIRE(q != nullptr);
    REQUIRE(q->available);
    REQUIRE(q->session == MarketSession::Regular);
    REQUIRE(q->symbol == "ZIEXT");
    REQUIRE(q->bid_size == 9700);
    REQUIRE_THAT(q->bid_price, Catch::Matchers::WithinRel(99.05, 1e-12));
    REQUIRE(q->ask_size == 1000);
    REQUIRE_THAT(q->ask_price, Catch::Matchers::WithinRel(99.07, 1e-12));
    REQUIRE(q->timestamp.as_nanos() == 1471980632572715948LL);
}

TEST_CASE("Decode trade report", "[decoder][reference]") {
    auto result = decode_message<std::string>(ByteSpan{TRADE_REPORT});
    REQUIRE(result.has_value());
    REQUIRE(result->remaining.empty());

    const auto* t = std::get_if<TradeReport<std::string>>(&result->value);
    REQUIRE(t != nullptr);
    REQUIRE(t->sale_condition == SaleCondition{});
    REQUIRE(t->size == 100);
    REQUIRE_THAT(t->price, Catch::Matchers::WithinRel(99.05, 1e-12));
    REQUIRE(t->id == 429974);
    REQUIRE(t->timestamp.as_nanos() == 1471980683662974915LL);
}

TEST_CASE("Decode system event", "[decoder][reference]") {
    auto result = decode_message<std::string>(ByteSpan{SYSTEM_EVENT});
    REQUIRE(result.has_value());
    REQUIRE(result->value == Message<std::string>{
        SystemEvent{SystemEventKind::EndOfSystemHours, Timestamp{1492448400000000000LL}}});
}

TEST_CASE("Truncated quote update is incomplete", "[decoder][reference]") {
    auto result = decode_message<std::string>(ByteSpan{QUOTE_UPDATE}.first(5));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category() == ErrorCategory::Incomplete);
    REQUIRE(result.error().tag == tag::QuoteUpdate);
    REQUIRE(result.error().required == 42);
}

TEST_CASE("Unknown tag is unrecognized", "[decoder][reference]") {
    auto bytes = std::vector<uint8_t>{QUOTE_UPDATE.begin(), QUOTE_UPDATE.end()};
    bytes[0] = 0xFF;
    auto result = decode_message<std::string>(ByteSpan{bytes});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().category() == ErrorCategory::UnrecognizedTag);
    REQUIRE(result.error().tag == 0xFF);
    REQUIRE(result.error().offset == 0);
}

// ============================================================================
// Dispatch Rules
// ============================================================================

TEST_CASE("Empty input is incomplete", "[decoder][dispatch]") {
    auto result = decode_message(ByteSpan{});
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().is_incomplete());
    REQUIRE(result.error().required == 1);
}

TEST_CASE("Every kind decodes at its documented length", "[decoder][dispatch]") {
    for (const auto& layout : MESSAGE_LAYOUTS) {
        CAPTURE(kind_name(layout.kind));
        auto msg = zero_body_message(layout);

        // Zero bytes are not a valid system event code
        if (layout.kind == MessageKind::SystemEvent) {
            msg[1] = 'O';
        }

        auto result = decode_message<std::string>(ByteSpan{msg});
        REQUIRE(result.has_value());
        REQUIRE(message_kind(result->value) == layout.kind);
        REQUIRE(result->remaining.empty());
        REQUIRE(std::holds_alternative<OpaqueMessage>(result->value) == layout.opaque);
    }
}

TEST_CASE("Every strict prefix is incomplete", "[decoder][dispatch]") {
    for (const auto& layout : MESSAGE_LAYOUTS) {
        CAPTURE(kind_name(layout.kind));
        auto msg = zero_body_message(layout);
        for (std::size_t len = 1; len < msg.size(); ++len) {
            CAPTURE(len);
            auto result = decode_message<std::string>(ByteSpan{msg}.first(len));
            REQUIRE_FALSE(result.has_value());
            REQUIRE(result.error().is_incomplete());
            REQUIRE(result.error().required == layout.total_size());
        }
    }
}

TEST_CASE("Unassigned tags are unrecognized", "[decoder][dispatch]") {
    std::vector<uint8_t> msg(MAX_MESSAGE_SIZE, 0);
    for (unsigned t = 0; t < 256; ++t) {
        msg[0] = static_cast<uint8_t>(t);
        if (find_layout(msg[0]) != nullptr) {
            continue;
        }
        auto result = decode_message<std::string>(ByteSpan{msg});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_unrecognized());
        REQUIRE(result.error().tag == msg[0]);
    }
}

TEST_CASE("0x4F means operational halt at the top level", "[decoder][dispatch]") {
    SECTION("As a tag") {
        auto msg = zero_body_message(layout_of(MessageKind::OperationalHaltStatus));
        REQUIRE(msg[0] == 0x4F);
        auto result = decode_message<std::string>(ByteSpan{msg});
        REQUIRE(result.has_value());
        REQUIRE(message_kind(result->value) == MessageKind::OperationalHaltStatus);
    }

    SECTION("As a system event code") {
        auto bytes = std::vector<uint8_t>{SYSTEM_EVENT.begin(), SYSTEM_EVENT.end()};
        bytes[1] = 0x4F;
        auto result = decode_message<std::string>(ByteSpan{bytes});
        REQUIRE(result.has_value());
        const auto& e = std::get<SystemEvent>(result->value);
        REQUIRE(e.kind == SystemEventKind::StartOfMessages);
    }
}

TEST_CASE("Malformed bodies are reported, not skipped", "[decoder][dispatch]") {
    SECTION("Quote update reserved bits") {
        auto bytes = std::vector<uint8_t>{QUOTE_UPDATE.begin(), QUOTE_UPDATE.end()};
        bytes[1] = 0x3F;
        auto result = decode_message<std::string>(ByteSpan{bytes});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category() == ErrorCategory::Malformed);
        REQUIRE(result.error().code == DecodeErrorCode::ReservedBitsSet);
    }

    SECTION("Trade report reserved bits") {
        auto bytes = std::vector<uint8_t>{TRADE_REPORT.begin(), TRADE_REPORT.end()};
        bytes[1] = 0x01;
        auto result = decode_message<std::string>(ByteSpan{bytes});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().is_malformed());
    }

    SECTION("Unknown system event") {
        auto bytes = std::vector<uint8_t>{SYSTEM_EVENT.begin(), SYSTEM_EVENT.end()};
        bytes[1] = 0x00;
        auto result = decode_message<std::string>(ByteSpan{bytes});
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == DecodeErrorCode::UnknownSystemEvent);
    }
}

// ============================================================================
// Properties
// ============================================================================

TEST_CASE("Decoding is idempotent", "[decoder][property]") {
    const ByteSpan input{QUOTE_UPDATE};
    auto first = decode_message<std::string>(input);
    auto second = decode_message<std::string>(input);
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->value == second->value);
    REQUIRE(first->remaining.size() == second->remaining.size());
}

TEST_CASE("Back-to-back messages", "[decoder][property]") {
    std::vector<uint8_t> stream;
    stream.insert(stream.end(), SYSTEM_EVENT.begin(), SYSTEM_EVENT.end());
    stream.insert(stream.end(), QUOTE_UPDATE.begin(), QUOTE_UPDATE.end());
    stream.insert(stream.end(), TRADE_REPORT.begin(), TRADE_REPORT.end());

    std::vector<MessageKind> kinds;
    ByteSpan rest{stream};
    while (!rest.empty()) {
        auto result = decode_message<FixedSymbol>(rest);
        REQUIRE(result.has_value());
        kinds.push_back(message_kind(result->value));
        rest = result->remaining;
    }

    REQUIRE(kinds == std::vector<MessageKind>{
        MessageKind::SystemEvent, MessageKind::QuoteUpdate, MessageKind::TradeReport});
}

TEST_CASE("Message size bounds", "[decoder][layout]") {
    STATIC_REQUIRE(MAX_MESSAGE_SIZE == 80);
    STATIC_REQUIRE(MIN_MESSAGE_SIZE == 10);
}

// ============================================================================
// dispatch()
// ============================================================================

TEST_CASE("Dispatch visits the decoded alternative", "[decoder][visit]") {
    int quotes = 0;
    int others = 0;
    auto handler = tops::detail::overloaded{
        [&](const QuoteUpdate<std::string>& q) {
            ++quotes;
            REQUIRE(q.symbol == "ZIEXT");
        },
        [&](const auto&) { ++others; },
    };

    auto rest = dispatch(ByteSpan{QUOTE_UPDATE}, handler);
    REQUIRE(rest.has_value());
    REQUIRE(rest->empty());
    REQUIRE(quotes == 1);
    REQUIRE(others == 0);

    rest = dispatch(ByteSpan{SYSTEM_EVENT}, handler);
    REQUIRE(rest.has_value());
    REQUIRE(others == 1);

    auto failed = dispatch(ByteSpan{QUOTE_UPDATE}.first(3), handler);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().is_incomplete());
    REQUIRE(quotes == 1);
}
