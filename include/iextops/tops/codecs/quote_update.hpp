#pragma once

#include <cstddef>
#include <type_traits>

#include "iextops/platform/platform.hpp"
#include "iextops/tops/message_table.hpp"
#include "iextops/tops/messages.hpp"
#include "iextops/tops/wire_types.hpp"

namespace iex::tops {

// ============================================================================
// QuoteUpdateCodec: Quote Update Message (0x51)
// ============================================================================
//
// Message Layout (42 bytes total: 1 tag + 41 body):
//   Offset  0:     tag          uint8      0x51
//   Offset  1:     flags        bitfield   A P - - - - - -
//   Offset  2-9:   timestamp    int64 LE   ns since epoch
//   Offset 10-17:  symbol       char[8]    space padded
//   Offset 18-21:  bidSize      uint32 LE
//   Offset 22-29:  bidPrice     int64 LE   price * 10000
//   Offset 30-37:  askPrice     int64 LE   price * 10000
//   Offset 38-41:  askSize      uint32 LE
//
// Flags (MSB first):
//   A  symbol availability: 1 = halted/paused/not found
//   P  market session:      1 = pre/post market
//   -  reserved, must be 0
//
// The bid side is size-then-price and the ask side price-then-size.

class QuoteUpdateCodec {
public:
    static constexpr MessageKind KIND = MessageKind::QuoteUpdate;
    static constexpr MessageLayout LAYOUT = layout_of(KIND);
    static constexpr uint8_t TAG = LAYOUT.tag;
    static constexpr std::size_t BLOCK_LENGTH = LAYOUT.body_length;
    static constexpr std::size_t TOTAL_SIZE = LAYOUT.total_size();

    using FlagBits = FlagByte<2>;

    struct FlagIndex {
        static constexpr std::size_t NotAvailable = 0;
        static constexpr std::size_t OutOfHours = 1;
    };

    struct Offset {
        static constexpr std::size_t Tag = 0;
        static constexpr std::size_t Flags = 1;
        static constexpr std::size_t Timestamp = 2;
        static constexpr std::size_t Symbol = 10;
        static constexpr std::size_t BidSize = 18;
        static constexpr std::size_t BidPrice = 22;
        static constexpr std::size_t AskPrice = 30;
        static constexpr std::size_t AskSize = 38;
    };

    struct Size {
        static constexpr std::size_t Flags = FlagBits::SIZE;
        static constexpr std::size_t Timestamp = NanoTimestamp::SIZE;
        static constexpr std::size_t Symbol = SymbolText::SIZE;
        static constexpr std::size_t BidSize = LeUint32::SIZE;
        static constexpr std::size_t BidPrice = ScaledPrice::SIZE;
        static constexpr std::size_t AskPrice = ScaledPrice::SIZE;
        static constexpr std::size_t AskSize = LeUint32::SIZE;
    };

    [[nodiscard]] static constexpr bool matches(ByteSpan input) noexcept {
        return !input.empty() && input[0] == TAG;
    }

    template <TopsSymbol Symbol>
    [[nodiscard]] IEX_HOT static DecodeResult<Decoded<QuoteUpdate<Symbol>>> decode(ByteSpan input)
        noexcept(std::is_nothrow_constructible_v<Symbol, std::string_view>) {
        if (auto frame = check_frame(LAYOUT, input); !frame) {
            return make_error(frame.error());
        }
        const TopsByte* buf = input.data();

        auto flags = FlagBits::decode(buf + Offset::Flags);
        if (!flags) [[unlikely]] {
            return make_error(DecodeError{flags.error().code, TAG, Offset::Flags});
        }

        return Decoded<QuoteUpdate<Symbol>>{
            QuoteUpdate<Symbol>{
                .available = !(*flags)[FlagIndex::NotAvailable],
                .session = (*flags)[FlagIndex::OutOfHours] ? MarketSession::OutOfHours
                                                           : MarketSession::Regular,
                .timestamp = NanoTimestamp::decode(buf + Offset::Timestamp),
                .symbol = SymbolText::decode_as<Symbol>(buf + Offset::Symbol),
                .bid_size = LeUint32::decode(buf + Offset::BidSize),
                .bid_price = ScaledPrice::decode(buf + Offset::BidPrice),
                .ask_size = LeUint32::decode(buf + Offset::AskSize),
                .ask_price = ScaledPrice::decode(buf + Offset::AskPrice),
            },
            input.subspan(TOTAL_SIZE)};
    }
};

// ============================================================================
// Static Assertions: Verify Layout
// ============================================================================

static_assert(QuoteUpdateCodec::TOTAL_SIZE == 42,
              "QuoteUpdate must be 42 bytes (1 tag + 41 body)");

static_assert(QuoteUpdateCodec::Offset::Flags + QuoteUpdateCodec::Size::Flags ==
              QuoteUpdateCodec::Offset::Timestamp);
static_assert(QuoteUpdateCodec::Offset::Timestamp + QuoteUpdateCodec::Size::Timestamp ==
              QuoteUpdateCodec::Offset::Symbol);
static_assert(QuoteUpdateCodec::Offset::Symbol + QuoteUpdateCodec::Size::Symbol ==
              QuoteUpdateCodec::Offset::BidSize);
static_assert(QuoteUpdateCodec::Offset::BidSize + QuoteUpdateCodec::Size::BidSize ==
              QuoteUpdateCodec::Offset::BidPrice);
static_assert(QuoteUpdateCodec::Offset::BidPrice + QuoteUpdateCodec::Size::BidPrice ==
              QuoteUpdateCodec::Offset::AskPrice);
static_assert(QuoteUpdateCodec::Offset::AskPrice + QuoteUpdateCodec::Size::AskPrice ==
              QuoteUpdateCodec::Offset::AskSize);
static_assert(QuoteUpdateCodec::Offset::AskSize + QuoteUpdateCodec::Size::AskSize ==
              QuoteUpdateCodec::TOTAL_SIZE,
              "Body layout must match BLOCK_LENGTH");

} // namespace iex::tops
