#pragma once

/// @file platform.hpp
/// @brief Build target description and the inlining hints used on the decode path

#include <bit>

// ============================================================================
// Target Names
// ============================================================================

#if defined(__linux__)
    #define IEX_PLATFORM_NAME "Linux"
#elif defined(__APPLE__) && defined(__MACH__)
    #define IEX_PLATFORM_NAME "macOS"
#elif defined(_WIN32)
    #define IEX_PLATFORM_NAME "Windows"
#else
    #define IEX_PLATFORM_NAME "Unknown"
#endif

#if defined(__x86_64__) || defined(_M_X64)
    #define IEX_ARCH_NAME "x86_64"
#elif defined(__aarch64__) || defined(_M_ARM64)
    #define IEX_ARCH_NAME "ARM64"
#else
    #define IEX_ARCH_NAME "Unknown"
#endif

// ============================================================================
// Decode Path Attributes
// ============================================================================
// Clang also defines __GNUC__, so the GNU branch covers both.

#if defined(_MSC_VER)
    #define IEX_COMPILER_NAME "MSVC"
    #define IEX_FORCE_INLINE __forceinline
    #define IEX_RESTRICT __restrict
    #define IEX_HOT
#elif defined(__GNUC__)
    #if defined(__clang__)
        #define IEX_COMPILER_NAME "Clang"
    #else
        #define IEX_COMPILER_NAME "GCC"
    #endif
    #define IEX_FORCE_INLINE __attribute__((always_inline)) inline
    #define IEX_RESTRICT __restrict__
    #define IEX_HOT [[gnu::hot]]
#else
    #define IEX_COMPILER_NAME "Unknown"
    #define IEX_FORCE_INLINE inline
    #define IEX_RESTRICT
    #define IEX_HOT
#endif

namespace iex::platform {

[[nodiscard]] constexpr const char* name() noexcept { return IEX_PLATFORM_NAME; }
[[nodiscard]] constexpr const char* compiler_name() noexcept { return IEX_COMPILER_NAME; }
[[nodiscard]] constexpr const char* arch_name() noexcept { return IEX_ARCH_NAME; }

/// TOPS is a little-endian protocol; on LE hosts field reads are plain loads
[[nodiscard]] constexpr bool is_little_endian() noexcept {
    return std::endian::native == std::endian::little;
}

} // namespace iex::platform
