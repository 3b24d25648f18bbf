#pragma once

#include <cstddef>

#include "iextops/platform/platform.hpp"
#include "iextops/tops/message_table.hpp"
#include "iextops/tops/messages.hpp"
#include "iextops/tops/wire_types.hpp"

namespace iex::tops {

// ============================================================================
// SystemEventCodec: System Event Message (0x53)
// ============================================================================
//
// Message Layout (10 bytes total: 1 tag + 9 body):
//   Offset 0:    tag          uint8      0x53
//   Offset 1:    eventCode    char       SystemEventKind
//   Offset 2-9:  timestamp    int64 LE   ns since epoch
//
// Dispatch is two level: the tag selects this codec, then the event code
// selects the kind. An event code outside the six known values is
// Malformed (UnknownSystemEvent).

class SystemEventCodec {
public:
    static constexpr MessageKind KIND = MessageKind::SystemEvent;
    static constexpr MessageLayout LAYOUT = layout_of(KIND);
    static constexpr uint8_t TAG = LAYOUT.tag;
    static constexpr std::size_t BLOCK_LENGTH = LAYOUT.body_length;
    static constexpr std::size_t TOTAL_SIZE = LAYOUT.total_size();

    struct Offset {
        static constexpr std::size_t Tag = 0;
        static constexpr std::size_t EventCode = 1;
        static constexpr std::size_t Timestamp = 2;
    };

    struct Size {
        static constexpr std::size_t EventCode = 1;
        static constexpr std::size_t Timestamp = NanoTimestamp::SIZE;
    };

    [[nodiscard]] static constexpr bool matches(ByteSpan input) noexcept {
        return !input.empty() && input[0] == TAG;
    }

    [[nodiscard]] IEX_HOT static constexpr DecodeResult<Decoded<SystemEvent>> decode(
        ByteSpan input) noexcept {
        if (auto frame = check_frame(LAYOUT, input); !frame) {
            return make_error(frame.error());
        }
        const TopsByte* buf = input.data();

        const auto kind = to_system_event_kind(read_uint8(buf + Offset::EventCode));
        if (!kind) [[unlikely]] {
            return make_error(DecodeError{DecodeErrorCode::UnknownSystemEvent, TAG,
                                          Offset::EventCode});
        }

        return Decoded<SystemEvent>{
            SystemEvent{*kind, NanoTimestamp::decode(buf + Offset::Timestamp)},
            input.subspan(TOTAL_SIZE)};
    }
};

static_assert(SystemEventCodec::TOTAL_SIZE == 10,
              "SystemEvent must be 10 bytes (1 tag + 9 body)");
static_assert(SystemEventCodec::Offset::Timestamp + SystemEventCodec::Size::Timestamp ==
              SystemEventCodec::TOTAL_SIZE,
              "Body layout must match BLOCK_LENGTH");

} // namespace iex::tops
