#pragma once

// ============================================================================
// TOPS 1.6 Message Layout Table
// ============================================================================
//
// Every message is a one-byte type tag followed by a fixed-length body.
// There is no length prefix at this layer, so the length of each kind is
// implied by its tag and must match the feed byte for byte:
//
//   Kind                        Tag    Body   Total
//   SystemEvent                 0x53      9      10
//   SecurityDirectory           0x44     30      31
//   TradingStatus               0x48     21      22
//   RetailLiquidityIndicator    0x49     17      18
//   OperationalHaltStatus       0x4F     17      18
//   ShortSalePriceTestStatus    0x50     18      19
//   QuoteUpdate                 0x51     41      42
//   TradeReport                 0x54     37      38
//   OfficialPrice               0x58     25      26
//   TradeBreak                  0x42     37      38
//   AuctionInformation          0x41     79      80
//
// Table order is dispatch priority. Codecs, the dispatcher and the stream
// statistics all read lengths from here.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "iextops/platform/platform.hpp"
#include "iextops/types/error.hpp"

namespace iex::tops {

using ByteSpan = std::span<const std::uint8_t>;

enum class MessageKind : uint8_t {
    SystemEvent,
    SecurityDirectory,
    TradingStatus,
    RetailLiquidityIndicator,
    OperationalHaltStatus,
    ShortSalePriceTestStatus,
    QuoteUpdate,
    TradeReport,
    OfficialPrice,
    TradeBreak,
    AuctionInformation
};

inline constexpr size_t MESSAGE_KIND_COUNT = 11;

[[nodiscard]] constexpr std::string_view kind_name(MessageKind k) noexcept {
    switch (k) {
        case MessageKind::SystemEvent:              return "SystemEvent";
        case MessageKind::SecurityDirectory:        return "SecurityDirectory";
        case MessageKind::TradingStatus:            return "TradingStatus";
        case MessageKind::RetailLiquidityIndicator: return "RetailLiquidityIndicator";
        case MessageKind::OperationalHaltStatus:    return "OperationalHaltStatus";
        case MessageKind::ShortSalePriceTestStatus: return "ShortSalePriceTestStatus";
        case MessageKind::QuoteUpdate:              return "QuoteUpdate";
        case MessageKind::TradeReport:              return "TradeReport";
        case MessageKind::OfficialPrice:            return "OfficialPrice";
        case MessageKind::TradeBreak:               return "TradeBreak";
        case MessageKind::AuctionInformation:       return "AuctionInformation";
    }
    return "Unknown";
}

// ============================================================================
// Message Type Tags
// ============================================================================

namespace tag {

inline constexpr uint8_t SystemEvent              = 0x53;  // 'S'
inline constexpr uint8_t SecurityDirectory        = 0x44;  // 'D'
inline constexpr uint8_t TradingStatus            = 0x48;  // 'H'
inline constexpr uint8_t RetailLiquidityIndicator = 0x49;  // 'I'
inline constexpr uint8_t OperationalHaltStatus    = 0x4F;  // 'O'
inline constexpr uint8_t ShortSalePriceTestStatus = 0x50;  // 'P'
inline constexpr uint8_t QuoteUpdate              = 0x51;  // 'Q'
inline constexpr uint8_t TradeReport              = 0x54;  // 'T'
inline constexpr uint8_t OfficialPrice            = 0x58;  // 'X'
inline constexpr uint8_t TradeBreak               = 0x42;  // 'B'
inline constexpr uint8_t AuctionInformation       = 0x41;  // 'A'

} // namespace tag

// ============================================================================
// Layout Table
// ============================================================================

inline constexpr size_t TAG_SIZE = 1;

struct MessageLayout {
    MessageKind kind;
    uint8_t tag;
    size_t body_length;  // Bytes after the tag
    bool opaque;         // Body consumed but not decoded

    [[nodiscard]] constexpr size_t total_size() const noexcept {
        return TAG_SIZE + body_length;
    }
};

inline constexpr std::array<MessageLayout, MESSAGE_KIND_COUNT> MESSAGE_LAYOUTS{{
    {MessageKind::SystemEvent,              tag::SystemEvent,               9, false},
    {MessageKind::SecurityDirectory,        tag::SecurityDirectory,        30, true},
    {MessageKind::TradingStatus,            tag::TradingStatus,            21, true},
    {MessageKind::RetailLiquidityIndicator, tag::RetailLiquidityIndicator, 17, true},
    {MessageKind::OperationalHaltStatus,    tag::OperationalHaltStatus,    17, true},
    {MessageKind::ShortSalePriceTestStatus, tag::ShortSalePriceTestStatus, 18, true},
    {MessageKind::QuoteUpdate,              tag::QuoteUpdate,              41, false},
    {MessageKind::TradeReport,              tag::TradeReport,              37, false},
    {MessageKind::OfficialPrice,            tag::OfficialPrice,            25, true},
    {MessageKind::TradeBreak,               tag::TradeBreak,               37, true},
    {MessageKind::AuctionInformation,       tag::AuctionInformation,       79, true},
}};

/// Layout for a kind (every kind has exactly one row)
[[nodiscard]] constexpr const MessageLayout& layout_of(MessageKind k) noexcept {
    for (const auto& layout : MESSAGE_LAYOUTS) {
        if (layout.kind == k) {
            return layout;
        }
    }
    return MESSAGE_LAYOUTS[0];
}

namespace detail {

inline constexpr uint8_t NO_LAYOUT = 0xFF;

/// tag byte -> row in MESSAGE_LAYOUTS; the first row in priority order wins
consteval std::array<uint8_t, 256> create_tag_index() {
    std::array<uint8_t, 256> index{};
    index.fill(NO_LAYOUT);
    for (size_t row = MESSAGE_LAYOUTS.size(); row-- > 0;) {
        index[MESSAGE_LAYOUTS[row].tag] = static_cast<uint8_t>(row);
    }
    return index;
}

inline constexpr auto TAG_INDEX = create_tag_index();

consteval bool tags_unique() {
    for (size_t i = 0; i < MESSAGE_LAYOUTS.size(); ++i) {
        for (size_t j = i + 1; j < MESSAGE_LAYOUTS.size(); ++j) {
            if (MESSAGE_LAYOUTS[i].tag == MESSAGE_LAYOUTS[j].tag) {
                return false;
            }
        }
    }
    return true;
}

consteval bool rows_match_kinds() {
    for (size_t row = 0; row < MESSAGE_LAYOUTS.size(); ++row) {
        if (static_cast<size_t>(MESSAGE_LAYOUTS[row].kind) != row) {
            return false;
        }
    }
    return true;
}

} // namespace detail

/// Highest-priority layout whose tag matches, or nullptr
[[nodiscard]] IEX_FORCE_INLINE constexpr const MessageLayout* find_layout(uint8_t tag_byte) noexcept {
    const uint8_t row = detail::TAG_INDEX[tag_byte];
    if (row == detail::NO_LAYOUT) {
        return nullptr;
    }
    return &MESSAGE_LAYOUTS[row];
}

static_assert(detail::tags_unique(), "TOPS tags must be unique at the top level");
static_assert(detail::rows_match_kinds(), "MESSAGE_LAYOUTS rows must follow MessageKind order");
static_assert(layout_of(MessageKind::SystemEvent).total_size() == 10);
static_assert(layout_of(MessageKind::QuoteUpdate).total_size() == 42);
static_assert(layout_of(MessageKind::TradeReport).total_size() == 38);
static_assert(layout_of(MessageKind::AuctionInformation).total_size() == 80);
static_assert(find_layout(0xFF) == nullptr);
static_assert(find_layout(tag::OperationalHaltStatus)->kind == MessageKind::OperationalHaltStatus);

// ============================================================================
// Frame Check
// ============================================================================

/// Verify the tag and that the whole fixed-length message is present.
/// A short buffer with the right tag is Incomplete, never Malformed.
[[nodiscard]] IEX_FORCE_INLINE constexpr DecodeResult<void> check_frame(
    const MessageLayout& layout, ByteSpan input) noexcept {
    if (input.empty()) {
        return make_error(DecodeError{DecodeErrorCode::Incomplete, layout.tag, 0,
                                      layout.total_size()});
    }
    if (input[0] != layout.tag) {
        return make_error(DecodeError{DecodeErrorCode::UnrecognizedTag, input[0], 0});
    }
    if (input.size() < layout.total_size()) {
        return make_error(DecodeError{DecodeErrorCode::Incomplete, layout.tag,
                                      input.size(), layout.total_size()});
    }
    return {};
}

} // namespace iex::tops
