#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <type_traits>

#include "iextops/platform/platform.hpp"
#include "iextops/tops/message_table.hpp"
#include "iextops/tops/symbol.hpp"
#include "iextops/types/error.hpp"
#include "iextops/types/field_types.hpp"

namespace iex::tops {

// ============================================================================
// TOPS Primitive Type Aliases
// ============================================================================

using TopsByte = std::uint8_t;
using TopsUint32 = std::uint32_t;
using TopsInt64 = std::int64_t;

// ============================================================================
// Decoded value plus the unconsumed input
// ============================================================================

template <typename T>
struct Decoded {
    T value;
    ByteSpan remaining;
};

// ============================================================================
// Little-Endian Read Utilities
// ============================================================================
// On little-endian hosts the runtime path is a single unaligned load.

template <typename T>
    requires std::is_integral_v<T>
[[nodiscard]] IEX_FORCE_INLINE constexpr T read_le(
    const TopsByte* IEX_RESTRICT buffer) noexcept {
    if (std::is_constant_evaluated() || !platform::is_little_endian()) {
        using U = std::make_unsigned_t<T>;
        U value{0};
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<U>(value | (static_cast<U>(buffer[i]) << (i * 8)));
        }
        return static_cast<T>(value);
    }
    T value;
    std::memcpy(&value, buffer, sizeof(T));
    return value;
}

[[nodiscard]] IEX_FORCE_INLINE constexpr TopsByte read_uint8(const TopsByte* buffer) noexcept {
    return buffer[0];
}

[[nodiscard]] IEX_FORCE_INLINE constexpr TopsUint32 read_uint32(const TopsByte* buffer) noexcept {
    return read_le<TopsUint32>(buffer);
}

[[nodiscard]] IEX_FORCE_INLINE constexpr TopsInt64 read_int64(const TopsByte* buffer) noexcept {
    return read_le<TopsInt64>(buffer);
}

// ============================================================================
// Field Codecs
// ============================================================================
// Each codec names its wire SIZE and decodes from a pointer that the caller
// has already bounds-checked. read_field() below adds the bounds check for
// callers walking a span.

/// Little-endian unsigned 32-bit (sizes)
struct LeUint32 {
    using value_type = TopsUint32;
    static constexpr std::size_t SIZE = 4;

    [[nodiscard]] IEX_FORCE_INLINE static constexpr value_type decode(
        const TopsByte* buffer) noexcept {
        return read_uint32(buffer);
    }
};

/// Little-endian signed 64-bit (identifiers)
struct LeInt64 {
    using value_type = TopsInt64;
    static constexpr std::size_t SIZE = 8;

    [[nodiscard]] IEX_FORCE_INLINE static constexpr value_type decode(
        const TopsByte* buffer) noexcept {
        return read_int64(buffer);
    }
};

/// Price: signed 64-bit integer with four implied decimals
struct ScaledPrice {
    using value_type = double;
    static constexpr std::size_t SIZE = 8;

    [[nodiscard]] IEX_FORCE_INLINE static constexpr value_type decode(
        const TopsByte* buffer) noexcept {
        return scaled_to_double(raw(buffer));
    }

    /// Integer value on the wire, before scaling
    [[nodiscard]] IEX_FORCE_INLINE static constexpr TopsInt64 raw(
        const TopsByte* buffer) noexcept {
        return read_int64(buffer);
    }
};

/// Timestamp: signed 64-bit nanoseconds since the Unix epoch (UTC)
struct NanoTimestamp {
    using value_type = Timestamp;
    static constexpr std::size_t SIZE = 8;

    [[nodiscard]] IEX_FORCE_INLINE static constexpr value_type decode(
        const TopsByte* buffer) noexcept {
        return Timestamp{read_int64(buffer)};
    }
};

// ============================================================================
// PaddedText<W>: Space-Padded Fixed-Width Text
// ============================================================================
// Right-padded with ASCII spaces. Only trailing spaces are trimmed; interior
// bytes, spaces included, are kept verbatim. No character set validation.

template <std::size_t W>
class PaddedText {
public:
    using value_type = std::string_view;
    static constexpr std::size_t SIZE = W;
    static constexpr TopsByte PADDING_CHAR = ' ';

    /// View over the trimmed text; borrows from buffer
    [[nodiscard]] IEX_FORCE_INLINE static std::string_view decode(
        const TopsByte* IEX_RESTRICT buffer) noexcept {
        std::size_t len = W;
        while (len > 0 && buffer[len - 1] == PADDING_CHAR) {
            --len;
        }
        return std::string_view{reinterpret_cast<const char*>(buffer), len};
    }

    /// Build the caller's symbol type from the trimmed text
    template <TopsSymbol Symbol>
    [[nodiscard]] IEX_FORCE_INLINE static Symbol decode_as(
        const TopsByte* IEX_RESTRICT buffer)
        noexcept(std::is_nothrow_constructible_v<Symbol, std::string_view>) {
        return Symbol{decode(buffer)};
    }
};

using SymbolText = PaddedText<SYMBOL_WIDTH>;

// ============================================================================
// FlagByte<N>: Bit-Packed Flags with Reserved-Bit Validation
// ============================================================================
// Bits are read most significant first: bit 7 is flag 0, bit 6 is flag 1,
// and so on. The low (8 - N) bits are reserved and must be zero; a set
// reserved bit fails the decode rather than being skipped.

template <std::size_t N>
    requires (N >= 1 && N <= 8)
class FlagByte {
public:
    using value_type = std::array<bool, N>;
    static constexpr std::size_t SIZE = 1;
    static constexpr std::size_t FLAG_COUNT = N;
    static constexpr TopsByte RESERVED_MASK = static_cast<TopsByte>((1u << (8 - N)) - 1u);

    [[nodiscard]] IEX_FORCE_INLINE static constexpr bool flag(TopsByte raw, std::size_t index) noexcept {
        return ((raw >> (7 - index)) & 0x01u) != 0;
    }

    [[nodiscard]] IEX_FORCE_INLINE static constexpr bool reserved_clear(TopsByte raw) noexcept {
        return (raw & RESERVED_MASK) == 0;
    }

    [[nodiscard]] IEX_FORCE_INLINE static constexpr DecodeResult<value_type> decode(
        const TopsByte* buffer) noexcept {
        const TopsByte raw = read_uint8(buffer);
        if (!reserved_clear(raw)) [[unlikely]] {
            return make_error(DecodeError{DecodeErrorCode::ReservedBitsSet});
        }
        value_type flags{};
        for (std::size_t i = 0; i < N; ++i) {
            flags[i] = flag(raw, i);
        }
        return flags;
    }
};

static_assert(FlagByte<2>::RESERVED_MASK == 0b0011'1111);
static_assert(FlagByte<5>::RESERVED_MASK == 0b0000'0111);
static_assert(FlagByte<8>::RESERVED_MASK == 0);

// ============================================================================
// Span-based field reads
// ============================================================================

namespace detail {

template <typename Codec>
struct is_checked_codec : std::false_type {};

template <std::size_t N>
struct is_checked_codec<FlagByte<N>> : std::true_type {};

} // namespace detail

/// Decode one field from the front of input and return it with the rest.
/// Fails with Incomplete when input is shorter than the field; flag bytes
/// additionally fail with ReservedBitsSet.
template <typename Codec>
[[nodiscard]] constexpr DecodeResult<Decoded<typename Codec::value_type>> read_field(
    ByteSpan input) noexcept {
    if (input.size() < Codec::SIZE) {
        return make_error(DecodeError{DecodeErrorCode::Incomplete, 0, input.size(), Codec::SIZE});
    }
    const ByteSpan rest = input.subspan(Codec::SIZE);
    if constexpr (detail::is_checked_codec<Codec>::value) {
        auto flags = Codec::decode(input.data());
        if (!flags) {
            return make_error(flags.error());
        }
        return Decoded<typename Codec::value_type>{*flags, rest};
    } else {
        return Decoded<typename Codec::value_type>{Codec::decode(input.data()), rest};
    }
}

/// Decode a padded text field of width W into the caller's symbol type
template <std::size_t W, TopsSymbol Symbol>
[[nodiscard]] DecodeResult<Decoded<Symbol>> read_text(ByteSpan input) {
    if (input.size() < W) {
        return make_error(DecodeError{DecodeErrorCode::Incomplete, 0, input.size(), W});
    }
    return Decoded<Symbol>{PaddedText<W>::template decode_as<Symbol>(input.data()),
                           input.subspan(W)};
}

} // namespace iex::tops
