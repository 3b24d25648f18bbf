#pragma once

#include <cstddef>

#include "iextops/platform/platform.hpp"
#include "iextops/tops/message_table.hpp"
#include "iextops/tops/messages.hpp"
#include "iextops/tops/wire_types.hpp"

namespace iex::tops {

// ============================================================================
// OpaqueCodec: Administrative and Auction Messages
// ============================================================================
//
// Security directory, trading status, retail liquidity, operational halt,
// short sale test, official price, trade break and auction information are
// framed but not field-decoded. The codec checks the tag, requires the full
// fixed-length body and consumes it; the result carries only the kind.

template <MessageKind Kind>
    requires (layout_of(Kind).opaque)
class OpaqueCodec {
public:
    static constexpr MessageKind KIND = Kind;
    static constexpr MessageLayout LAYOUT = layout_of(KIND);
    static constexpr uint8_t TAG = LAYOUT.tag;
    static constexpr std::size_t BLOCK_LENGTH = LAYOUT.body_length;
    static constexpr std::size_t TOTAL_SIZE = LAYOUT.total_size();

    [[nodiscard]] static constexpr bool matches(ByteSpan input) noexcept {
        return !input.empty() && input[0] == TAG;
    }

    [[nodiscard]] static constexpr DecodeResult<Decoded<OpaqueMessage>> decode(
        ByteSpan input) noexcept {
        if (auto frame = check_frame(LAYOUT, input); !frame) {
            return make_error(frame.error());
        }
        return Decoded<OpaqueMessage>{OpaqueMessage{KIND}, input.subspan(TOTAL_SIZE)};
    }
};

using SecurityDirectoryCodec = OpaqueCodec<MessageKind::SecurityDirectory>;
using TradingStatusCodec = OpaqueCodec<MessageKind::TradingStatus>;
using RetailLiquidityIndicatorCodec = OpaqueCodec<MessageKind::RetailLiquidityIndicator>;
using OperationalHaltStatusCodec = OpaqueCodec<MessageKind::OperationalHaltStatus>;
using ShortSalePriceTestStatusCodec = OpaqueCodec<MessageKind::ShortSalePriceTestStatus>;
using OfficialPriceCodec = OpaqueCodec<MessageKind::OfficialPrice>;
using TradeBreakCodec = OpaqueCodec<MessageKind::TradeBreak>;
using AuctionInformationCodec = OpaqueCodec<MessageKind::AuctionInformation>;

/// Runtime-kind variant used by the dispatcher once it has a layout row
[[nodiscard]] IEX_FORCE_INLINE constexpr DecodeResult<Decoded<OpaqueMessage>> decode_opaque(
    const MessageLayout& layout, ByteSpan input) noexcept {
    if (auto frame = check_frame(layout, input); !frame) {
        return make_error(frame.error());
    }
    return Decoded<OpaqueMessage>{OpaqueMessage{layout.kind}, input.subspan(layout.total_size())};
}

static_assert(SecurityDirectoryCodec::TOTAL_SIZE == 31);
static_assert(TradingStatusCodec::TOTAL_SIZE == 22);
static_assert(RetailLiquidityIndicatorCodec::TOTAL_SIZE == 18);
static_assert(OperationalHaltStatusCodec::TOTAL_SIZE == 18);
static_assert(ShortSalePriceTestStatusCodec::TOTAL_SIZE == 19);
static_assert(OfficialPriceCodec::TOTAL_SIZE == 26);
static_assert(TradeBreakCodec::TOTAL_SIZE == 38);
static_assert(AuctionInformationCodec::TOTAL_SIZE == 80);

} // namespace iex::tops
