#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

namespace iex {

// ============================================================================
// Error Categories
// ============================================================================
//
// Every decode failure falls in exactly one category. Incomplete is not a
// protocol violation: the caller buffers more bytes and retries.

enum class ErrorCategory : uint8_t {
    None = 0,
    Incomplete,
    Malformed,
    UnrecognizedTag,
    Capacity
};

[[nodiscard]] constexpr std::string_view category_name(ErrorCategory c) noexcept {
    switch (c) {
        case ErrorCategory::None:            return "None";
        case ErrorCategory::Incomplete:      return "Incomplete";
        case ErrorCategory::Malformed:       return "Malformed";
        case ErrorCategory::UnrecognizedTag: return "UnrecognizedTag";
        case ErrorCategory::Capacity:        return "Capacity";
    }
    return "Unknown";
}

// ============================================================================
// Decode Errors (zero-allocation, deterministic)
// ============================================================================

enum class DecodeErrorCode : uint8_t {
    None = 0,
    Incomplete,
    ReservedBitsSet,
    UnknownSystemEvent,
    UnrecognizedTag,
    BufferOverflow
};

inline constexpr size_t DECODE_ERROR_COUNT = 6;

// ============================================================================
// Compile-time DecodeError Info
// ============================================================================

namespace detail {

template<DecodeErrorCode Code>
struct DecodeErrorInfo {
    static constexpr std::string_view message = "Unknown error";
    static constexpr ErrorCategory category = ErrorCategory::Malformed;
};

template<> struct DecodeErrorInfo<DecodeErrorCode::None> {
    static constexpr std::string_view message = "No error";
    static constexpr ErrorCategory category = ErrorCategory::None;
};

template<> struct DecodeErrorInfo<DecodeErrorCode::Incomplete> {
    static constexpr std::string_view message = "Incomplete message";
    static constexpr ErrorCategory category = ErrorCategory::Incomplete;
};

template<> struct DecodeErrorInfo<DecodeErrorCode::ReservedBitsSet> {
    static constexpr std::string_view message = "Reserved flag bits set";
    static constexpr ErrorCategory category = ErrorCategory::Malformed;
};

template<> struct DecodeErrorInfo<DecodeErrorCode::UnknownSystemEvent> {
    static constexpr std::string_view message = "Unknown system event code";
    static constexpr ErrorCategory category = ErrorCategory::Malformed;
};

template<> struct DecodeErrorInfo<DecodeErrorCode::UnrecognizedTag> {
    static constexpr std::string_view message = "Unrecognized message type";
    static constexpr ErrorCategory category = ErrorCategory::UnrecognizedTag;
};

template<> struct DecodeErrorInfo<DecodeErrorCode::BufferOverflow> {
    static constexpr std::string_view message = "Stream buffer limit exceeded";
    static constexpr ErrorCategory category = ErrorCategory::Capacity;
};

struct DecodeErrorEntry {
    std::string_view message;
    ErrorCategory category;
};

template<DecodeErrorCode Code>
consteval DecodeErrorEntry make_entry() {
    return {DecodeErrorInfo<Code>::message, DecodeErrorInfo<Code>::category};
}

/// Generate DecodeError lookup table at compile time
consteval std::array<DecodeErrorEntry, DECODE_ERROR_COUNT> create_decode_error_table() {
    std::array<DecodeErrorEntry, DECODE_ERROR_COUNT> table{};
    table[0] = make_entry<DecodeErrorCode::None>();
    table[1] = make_entry<DecodeErrorCode::Incomplete>();
    table[2] = make_entry<DecodeErrorCode::ReservedBitsSet>();
    table[3] = make_entry<DecodeErrorCode::UnknownSystemEvent>();
    table[4] = make_entry<DecodeErrorCode::UnrecognizedTag>();
    table[5] = make_entry<DecodeErrorCode::BufferOverflow>();
    return table;
}

inline constexpr auto DECODE_ERROR_TABLE = create_decode_error_table();

} // namespace detail

/// Compile-time query (when code is known at compile time)
template<DecodeErrorCode Code>
[[nodiscard]] consteval std::string_view decode_error_message() noexcept {
    return detail::DecodeErrorInfo<Code>::message;
}

/// Runtime query using O(1) lookup table
[[nodiscard]] inline constexpr std::string_view decode_error_message(DecodeErrorCode code) noexcept {
    const auto idx = static_cast<uint8_t>(code);
    if (idx < detail::DECODE_ERROR_TABLE.size()) [[likely]] {
        return detail::DECODE_ERROR_TABLE[idx].message;
    }
    return "Unknown error";
}

[[nodiscard]] inline constexpr ErrorCategory decode_error_category(DecodeErrorCode code) noexcept {
    const auto idx = static_cast<uint8_t>(code);
    if (idx < detail::DECODE_ERROR_TABLE.size()) [[likely]] {
        return detail::DECODE_ERROR_TABLE[idx].category;
    }
    return ErrorCategory::Malformed;
}

static_assert(detail::DecodeErrorInfo<DecodeErrorCode::None>::message == "No error");
static_assert(detail::DECODE_ERROR_TABLE[1].category == ErrorCategory::Incomplete);
static_assert(detail::DECODE_ERROR_TABLE[2].category == ErrorCategory::Malformed);
static_assert(detail::DECODE_ERROR_TABLE[4].category == ErrorCategory::UnrecognizedTag);

struct DecodeError {
    DecodeErrorCode code;
    uint8_t tag;       // Message type byte (0 if not yet read)
    size_t offset;     // Byte offset of the offending field or message
    size_t required;   // Bytes needed for the full message (Incomplete only)

    constexpr DecodeError() noexcept
        : code{DecodeErrorCode::None}, tag{0}, offset{0}, required{0} {}

    constexpr DecodeError(DecodeErrorCode c) noexcept
        : code{c}, tag{0}, offset{0}, required{0} {}

    constexpr DecodeError(DecodeErrorCode c, uint8_t t) noexcept
        : code{c}, tag{t}, offset{0}, required{0} {}

    constexpr DecodeError(DecodeErrorCode c, uint8_t t, size_t off) noexcept
        : code{c}, tag{t}, offset{off}, required{0} {}

    constexpr DecodeError(DecodeErrorCode c, uint8_t t, size_t off, size_t req) noexcept
        : code{c}, tag{t}, offset{off}, required{req} {}

    [[nodiscard]] constexpr bool ok() const noexcept {
        return code == DecodeErrorCode::None;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept {
        return !ok();
    }

    [[nodiscard]] constexpr ErrorCategory category() const noexcept {
        return decode_error_category(code);
    }

    [[nodiscard]] constexpr bool is_incomplete() const noexcept {
        return category() == ErrorCategory::Incomplete;
    }

    [[nodiscard]] constexpr bool is_malformed() const noexcept {
        return category() == ErrorCategory::Malformed;
    }

    [[nodiscard]] constexpr bool is_unrecognized() const noexcept {
        return category() == ErrorCategory::UnrecognizedTag;
    }

    [[nodiscard]] constexpr std::string_view message() const noexcept {
        return decode_error_message(code);
    }

    constexpr bool operator==(const DecodeError&) const noexcept = default;
};

// ============================================================================
// Result Type Alias (using std::expected)
// ============================================================================

template <typename T>
using DecodeResult = std::expected<T, DecodeError>;

/// Create error result
template <typename E>
[[nodiscard]] constexpr auto make_error(E error) noexcept {
    return std::unexpected{error};
}

/// Shift an error's offset by the position of the sub-buffer it came from
[[nodiscard]] constexpr DecodeError rebase(DecodeError error, size_t base) noexcept {
    error.offset += base;
    return error;
}

} // namespace iex
