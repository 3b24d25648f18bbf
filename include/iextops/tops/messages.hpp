#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "iextops/tops/message_table.hpp"
#include "iextops/tops/symbol.hpp"
#include "iextops/types/field_types.hpp"

namespace iex::tops {

// ============================================================================
// System Event
// ============================================================================

enum class SystemEventKind : char {
    StartOfMessages     = 'O',
    StartOfSystemHours  = 'S',
    StartOfRegularHours = 'R',
    EndOfRegularHours   = 'M',
    EndOfSystemHours    = 'E',
    EndOfMessages       = 'C'
};

[[nodiscard]] constexpr std::string_view system_event_name(SystemEventKind k) noexcept {
    switch (k) {
        case SystemEventKind::StartOfMessages:     return "StartOfMessages";
        case SystemEventKind::StartOfSystemHours:  return "StartOfSystemHours";
        case SystemEventKind::StartOfRegularHours: return "StartOfRegularHours";
        case SystemEventKind::EndOfRegularHours:   return "EndOfRegularHours";
        case SystemEventKind::EndOfSystemHours:    return "EndOfSystemHours";
        case SystemEventKind::EndOfMessages:       return "EndOfMessages";
    }
    return "Unknown";
}

/// Map the subtype byte of a system event; nullopt for anything else.
/// Note the byte values overlap top-level tags ('O', 'S') with a different
/// meaning: they are only ever read after the 0x53 tag.
[[nodiscard]] constexpr std::optional<SystemEventKind> to_system_event_kind(uint8_t code) noexcept {
    switch (code) {
        case 'O': return SystemEventKind::StartOfMessages;
        case 'S': return SystemEventKind::StartOfSystemHours;
        case 'R': return SystemEventKind::StartOfRegularHours;
        case 'M': return SystemEventKind::EndOfRegularHours;
        case 'E': return SystemEventKind::EndOfSystemHours;
        case 'C': return SystemEventKind::EndOfMessages;
        default:  return std::nullopt;
    }
}

struct SystemEvent {
    SystemEventKind kind;
    Timestamp timestamp;

    constexpr bool operator==(const SystemEvent&) const noexcept = default;
};

// ============================================================================
// Quote Update
// ============================================================================

enum class MarketSession : uint8_t {
    Regular,
    OutOfHours
};

[[nodiscard]] constexpr std::string_view market_session_name(MarketSession s) noexcept {
    switch (s) {
        case MarketSession::Regular:    return "Regular";
        case MarketSession::OutOfHours: return "OutOfHours";
    }
    return "Unknown";
}

template <TopsSymbol Symbol>
struct QuoteUpdate {
    bool available;  // Wire carries "symbol not available"; stored inverted
    MarketSession session;
    Timestamp timestamp;
    Symbol symbol;
    uint32_t bid_size;
    double bid_price;
    uint32_t ask_size;
    double ask_price;

    bool operator==(const QuoteUpdate&) const = default;
};

// ============================================================================
// Trade Report
// ============================================================================

struct SaleCondition {
    bool intermarket_sweep;
    bool extended_hours;
    bool odd_lot;
    bool trade_through_exempt;
    bool single_price;

    constexpr bool operator==(const SaleCondition&) const noexcept = default;
};

template <TopsSymbol Symbol>
struct TradeReport {
    SaleCondition sale_condition;
    Timestamp timestamp;
    Symbol symbol;
    uint32_t size;
    double price;
    int64_t id;  // Opaque trade identifier

    bool operator==(const TradeReport&) const = default;
};

// ============================================================================
// Opaque Administrative Messages
// ============================================================================
// Known message types whose bodies are consumed without field decoding.
// Only the kind is observable.

struct OpaqueMessage {
    MessageKind kind;

    constexpr bool operator==(const OpaqueMessage&) const noexcept = default;
};

// ============================================================================
// Message: exactly one decoded record
// ============================================================================

template <TopsSymbol Symbol>
using Message = std::variant<SystemEvent, QuoteUpdate<Symbol>, TradeReport<Symbol>, OpaqueMessage>;

namespace detail {

template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

} // namespace detail

/// Which of the eleven message kinds a decoded record came from
template <TopsSymbol Symbol>
[[nodiscard]] constexpr MessageKind message_kind(const Message<Symbol>& msg) noexcept {
    return std::visit(detail::overloaded{
        [](const SystemEvent&) { return MessageKind::SystemEvent; },
        [](const QuoteUpdate<Symbol>&) { return MessageKind::QuoteUpdate; },
        [](const TradeReport<Symbol>&) { return MessageKind::TradeReport; },
        [](const OpaqueMessage& m) { return m.kind; },
    }, msg);
}

} // namespace iex::tops
