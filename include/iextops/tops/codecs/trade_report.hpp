#pragma once

#include <cstddef>
#include <type_traits>

#include "iextops/platform/platform.hpp"
#include "iextops/tops/message_table.hpp"
#include "iextops/tops/messages.hpp"
#include "iextops/tops/wire_types.hpp"

namespace iex::tops {

// ============================================================================
// TradeReportCodec: Trade Report Message (0x54)
// ============================================================================
//
// Message Layout (38 bytes total: 1 tag + 37 body):
//   Offset  0:     tag            uint8      0x54
//   Offset  1:     saleCondition  bitfield   F T I 8 X - - -
//   Offset  2-9:   timestamp      int64 LE   ns since epoch
//   Offset 10-17:  symbol         char[8]    space padded
//   Offset 18-21:  size           uint32 LE
//   Offset 22-29:  price          int64 LE   price * 10000
//   Offset 30-37:  tradeId        int64 LE
//
// Sale condition flags (MSB first):
//   F  intermarket sweep
//   T  extended hours
//   I  odd lot
//   8  trade through exempt
//   X  single-price cross
//   -  reserved, must be 0

class TradeReportCodec {
public:
    static constexpr MessageKind KIND = MessageKind::TradeReport;
    static constexpr MessageLayout LAYOUT = layout_of(KIND);
    static constexpr uint8_t TAG = LAYOUT.tag;
    static constexpr std::size_t BLOCK_LENGTH = LAYOUT.body_length;
    static constexpr std::size_t TOTAL_SIZE = LAYOUT.total_size();

    using FlagBits = FlagByte<5>;

    struct FlagIndex {
        static constexpr std::size_t IntermarketSweep = 0;
        static constexpr std::size_t ExtendedHours = 1;
        static constexpr std::size_t OddLot = 2;
        static constexpr std::size_t TradeThroughExempt = 3;
        static constexpr std::size_t SinglePrice = 4;
    };

    struct Offset {
        static constexpr std::size_t Tag = 0;
        static constexpr std::size_t SaleCondition = 1;
        static constexpr std::size_t Timestamp = 2;
        static constexpr std::size_t Symbol = 10;
        static constexpr std::size_t TradeSize = 18;
        static constexpr std::size_t Price = 22;
        static constexpr std::size_t TradeId = 30;
    };

    struct Size {
        static constexpr std::size_t SaleCondition = FlagBits::SIZE;
        static constexpr std::size_t Timestamp = NanoTimestamp::SIZE;
        static constexpr std::size_t Symbol = SymbolText::SIZE;
        static constexpr std::size_t TradeSize = LeUint32::SIZE;
        static constexpr std::size_t Price = ScaledPrice::SIZE;
        static constexpr std::size_t TradeId = LeInt64::SIZE;
    };

    [[nodiscard]] static constexpr bool matches(ByteSpan input) noexcept {
        return !input.empty() && input[0] == TAG;
    }

    /// Decode the sale condition flag byte on its own
    [[nodiscard]] static constexpr DecodeResult<SaleCondition> decode_sale_condition(
        const TopsByte* buffer) noexcept {
        return FlagBits::decode(buffer).transform([](const FlagBits::value_type& f) {
            return SaleCondition{
                .intermarket_sweep = f[FlagIndex::IntermarketSweep],
                .extended_hours = f[FlagIndex::ExtendedHours],
                .odd_lot = f[FlagIndex::OddLot],
                .trade_through_exempt = f[FlagIndex::TradeThroughExempt],
                .single_price = f[FlagIndex::SinglePrice],
            };
        });
    }

    template <TopsSymbol Symbol>
    [[nodiscard]] IEX_HOT static DecodeResult<Decoded<TradeReport<Symbol>>> decode(ByteSpan input)
        noexcept(std::is_nothrow_constructible_v<Symbol, std::string_view>) {
        if (auto frame = check_frame(LAYOUT, input); !frame) {
            return make_error(frame.error());
        }
        const TopsByte* buf = input.data();

        auto condition = decode_sale_condition(buf + Offset::SaleCondition);
        if (!condition) [[unlikely]] {
            return make_error(DecodeError{condition.error().code, TAG, Offset::SaleCondition});
        }

        return Decoded<TradeReport<Symbol>>{
            TradeReport<Symbol>{
                .sale_condition = *condition,
                .timestamp = NanoTimestamp::decode(buf + Offset::Timestamp),
                .symbol = SymbolText::decode_as<Symbol>(buf + Offset::Symbol),
                .size = LeUint32::decode(buf + Offset::TradeSize),
                .price = ScaledPrice::decode(buf + Offset::Price),
                .id = LeInt64::decode(buf + Offset::TradeId),
            },
            input.subspan(TOTAL_SIZE)};
    }
};

// ============================================================================
// Static Assertions: Verify Layout
// ============================================================================

static_assert(TradeReportCodec::TOTAL_SIZE == 38,
              "TradeReport must be 38 bytes (1 tag + 37 body)");

static_assert(TradeReportCodec::Offset::Symbol + TradeReportCodec::Size::Symbol ==
              TradeReportCodec::Offset::TradeSize);
static_assert(TradeReportCodec::Offset::TradeSize + TradeReportCodec::Size::TradeSize ==
              TradeReportCodec::Offset::Price);
static_assert(TradeReportCodec::Offset::Price + TradeReportCodec::Size::Price ==
              TradeReportCodec::Offset::TradeId);
static_assert(TradeReportCodec::Offset::TradeId + TradeReportCodec::Size::TradeId ==
              TradeReportCodec::TOTAL_SIZE,
              "Body layout must match BLOCK_LENGTH");

} // namespace iex::tops
