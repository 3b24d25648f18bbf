#pragma once

/// @file iextops.hpp
/// @brief Main header for the IexTops IEX TOPS 1.6 market data decoder

// Platform
#include "iextops/platform/platform.hpp"

// Types
#include "iextops/types/error.hpp"
#include "iextops/types/field_types.hpp"

// Utilities
#include "iextops/util/logger.hpp"
#include "iextops/util/symbol_table.hpp"

// TOPS protocol
#include "iextops/tops/message_table.hpp"
#include "iextops/tops/symbol.hpp"
#include "iextops/tops/wire_types.hpp"
#include "iextops/tops/messages.hpp"
#include "iextops/tops/codecs/system_event.hpp"
#include "iextops/tops/codecs/quote_update.hpp"
#include "iextops/tops/codecs/trade_report.hpp"
#include "iextops/tops/codecs/opaque_message.hpp"
#include "iextops/tops/decoder.hpp"
#include "iextops/tops/stream_decoder.hpp"

namespace iex {

/// Library version
inline constexpr struct {
    int major = 0;
    int minor = 1;
    int patch = 0;

    [[nodiscard]] constexpr const char* string() const noexcept {
        return "0.1.0";
    }
} VERSION;

/// TOPS protocol revision this decoder implements
inline constexpr const char* TOPS_VERSION = "1.6";

} // namespace iex
