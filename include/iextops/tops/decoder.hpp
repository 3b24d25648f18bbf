#pragma once

// ============================================================================
// IexTops Message Decoder
// ============================================================================
//
// Decodes exactly one TOPS 1.6 message from the front of a buffer that starts
// on a message boundary. Stateless and allocation free apart from whatever
// the chosen Symbol type does on construction.
//
// Usage (Decode):
//   auto result = tops::decode_message<FixedSymbol>(bytes);
//   if (result) {
//       const auto& msg = result->value;       // Message<FixedSymbol>
//       bytes = result->remaining;             // next message starts here
//   } else if (result.error().is_incomplete()) {
//       // buffer more bytes and retry
//   }
//
// Usage (Dispatch):
//   auto rest = tops::dispatch(bytes, detail::overloaded{
//       [](const SystemEvent& e) { ... },
//       [](const QuoteUpdate<std::string>& q) { ... },
//       [](const auto&) {}
//   });

#include <algorithm>
#include <string>
#include <utility>
#include <variant>

#include "iextops/platform/platform.hpp"
#include "iextops/types/error.hpp"
#include "iextops/tops/message_table.hpp"
#include "iextops/tops/messages.hpp"
#include "iextops/tops/wire_types.hpp"
#include "iextops/tops/codecs/system_event.hpp"
#include "iextops/tops/codecs/quote_update.hpp"
#include "iextops/tops/codecs/trade_report.hpp"
#include "iextops/tops/codecs/opaque_message.hpp"

namespace iex::tops {

// ============================================================================
// Buffer Size Helpers
// ============================================================================

namespace detail {

consteval std::size_t max_total_size() {
    std::size_t result = 0;
    for (const auto& layout : MESSAGE_LAYOUTS) {
        result = std::max(result, layout.total_size());
    }
    return result;
}

consteval std::size_t min_total_size() {
    std::size_t result = MESSAGE_LAYOUTS[0].total_size();
    for (const auto& layout : MESSAGE_LAYOUTS) {
        result = std::min(result, layout.total_size());
    }
    return result;
}

/// Widen a shape decoder's result into the Message variant
template <TopsSymbol Symbol, typename T>
[[nodiscard]] IEX_FORCE_INLINE DecodeResult<Decoded<Message<Symbol>>> lift(
    DecodeResult<Decoded<T>>&& result) {
    return std::move(result).transform([](Decoded<T>&& d) {
        return Decoded<Message<Symbol>>{Message<Symbol>{std::move(d.value)}, d.remaining};
    });
}

} // namespace detail

/// Largest message across all kinds (AuctionInformation)
inline constexpr std::size_t MAX_MESSAGE_SIZE = detail::max_total_size();

/// Smallest message across all kinds (SystemEvent)
inline constexpr std::size_t MIN_MESSAGE_SIZE = detail::min_total_size();

static_assert(MAX_MESSAGE_SIZE == 80);
static_assert(MIN_MESSAGE_SIZE == 10);

// ============================================================================
// decode_message
// ============================================================================

/// Decode one message and return it with the unconsumed remainder.
///
/// Failures:
///   - empty input, or a known tag with a short body: Incomplete
///   - known tag, full body, invalid field: Malformed
///   - no kind has this tag: UnrecognizedTag (error().tag is the byte)
///
/// Tags are unique at the top level, so the first row of the layout table
/// whose tag matches is the only candidate.
template <TopsSymbol Symbol = std::string>
[[nodiscard]] IEX_HOT DecodeResult<Decoded<Message<Symbol>>> decode_message(ByteSpan input) {
    if (input.empty()) [[unlikely]] {
        return make_error(DecodeError{DecodeErrorCode::Incomplete, 0, 0, TAG_SIZE});
    }

    const MessageLayout* layout = find_layout(input[0]);
    if (layout == nullptr) [[unlikely]] {
        return make_error(DecodeError{DecodeErrorCode::UnrecognizedTag, input[0], 0});
    }

    switch (layout->kind) {
        case MessageKind::SystemEvent:
            return detail::lift<Symbol>(SystemEventCodec::decode(input));
        case MessageKind::QuoteUpdate:
            return detail::lift<Symbol>(QuoteUpdateCodec::decode<Symbol>(input));
        case MessageKind::TradeReport:
            return detail::lift<Symbol>(TradeReportCodec::decode<Symbol>(input));
        default:
            return detail::lift<Symbol>(decode_opaque(*layout, input));
    }
}

// ============================================================================
// Dispatch
// ============================================================================

/// Decode one message and hand the populated alternative to handler.
/// Handler must accept every alternative of Message<Symbol> (a generic
/// lambda or detail::overloaded). Returns the remaining input.
template <TopsSymbol Symbol = std::string, typename Handler>
IEX_HOT DecodeResult<ByteSpan> dispatch(ByteSpan input, Handler&& handler) {
    auto decoded = decode_message<Symbol>(input);
    if (!decoded) {
        return make_error(decoded.error());
    }
    std::visit(std::forward<Handler>(handler), decoded->value);
    return decoded->remaining;
}

} // namespace iex::tops
