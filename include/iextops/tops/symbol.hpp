#pragma once

#include <algorithm>
#include <array>
#include <compare>
#include <concepts>
#include <cstdint>
#include <string_view>

#include "iextops/util/symbol_table.hpp"

namespace iex::tops {

// ============================================================================
// Symbol Representation Concept
// ============================================================================
//
// Decoders never pick a string type. The caller names one at compile time and
// the padded text field is converted with Symbol{std::string_view}. Any type
// satisfying the concept works:
//
//   decode_message<std::string>(buf)       owned copy
//   decode_message<std::string_view>(buf)  borrowed view into buf
//   decode_message<FixedSymbol>(buf)       inline 8 bytes, no allocation
//   decode_message<InternedSymbol>(buf)    32-bit id into SymbolTable

template <typename S>
concept TopsSymbol = std::constructible_from<S, std::string_view> &&
                     std::copy_constructible<S>;

/// Width of the symbol field in every TOPS message that carries one
inline constexpr std::size_t SYMBOL_WIDTH = 8;

// ============================================================================
// FixedSymbol: inline symbol storage
// ============================================================================

class FixedSymbol {
public:
    static constexpr std::size_t CAPACITY = SYMBOL_WIDTH;

    constexpr FixedSymbol() noexcept = default;

    /// Text longer than CAPACITY is truncated
    constexpr explicit FixedSymbol(std::string_view text) noexcept
        : size_{static_cast<uint8_t>(std::min(text.size(), CAPACITY))} {
        std::copy_n(text.data(), size_, data_.begin());
    }

    [[nodiscard]] constexpr std::string_view view() const noexcept {
        return {data_.data(), size_};
    }

    [[nodiscard]] constexpr std::size_t size() const noexcept { return size_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size_ == 0; }

    constexpr bool operator==(const FixedSymbol& other) const noexcept {
        return view() == other.view();
    }

    constexpr auto operator<=>(const FixedSymbol& other) const noexcept {
        return view() <=> other.view();
    }

    friend constexpr bool operator==(const FixedSymbol& lhs, std::string_view rhs) noexcept {
        return lhs.view() == rhs;
    }

private:
    std::array<char, CAPACITY> data_{};
    uint8_t size_{0};
};

// ============================================================================
// InternedSymbol: handle into the process-wide SymbolTable
// ============================================================================

class InternedSymbol {
public:
    using Id = util::SymbolTable::Id;

    /// Id of a default-constructed handle; resolves to empty text
    static constexpr Id NONE = UINT32_MAX;

    InternedSymbol() = default;

    explicit InternedSymbol(std::string_view text)
        : id_{util::SymbolTable::global().intern(text)} {}

    [[nodiscard]] Id id() const noexcept { return id_; }

    [[nodiscard]] std::string_view view() const {
        return util::SymbolTable::global().resolve(id_);
    }

    bool operator==(const InternedSymbol&) const noexcept = default;
    auto operator<=>(const InternedSymbol&) const noexcept = default;

    friend bool operator==(const InternedSymbol& lhs, std::string_view rhs) {
        return lhs.view() == rhs;
    }

private:
    Id id_{NONE};
};

static_assert(TopsSymbol<FixedSymbol>);
static_assert(TopsSymbol<InternedSymbol>);
static_assert(TopsSymbol<std::string_view>);

} // namespace iex::tops
