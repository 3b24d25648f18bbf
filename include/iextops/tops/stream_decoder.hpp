/*
    IexTops Stream Decoder

    Buffered front end over decode_message() for callers that receive a TOPS
    byte stream in arbitrary chunks (socket reads, file blocks). Bytes are
    appended with feed(); poll() then delivers every complete message in
    order and keeps a trailing partial message for the next round.

    One instance per feed; not thread safe.
*/

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "iextops/tops/decoder.hpp"
#include "iextops/util/logger.hpp"

namespace iex::tops {

// ============================================================================
// Configuration and Statistics
// ============================================================================

struct StreamDecoderConfig {
    size_t initial_capacity = 64 * 1024;  // Bytes reserved up front
    size_t max_buffered = 1024 * 1024;    // feed() fails beyond this
    bool stop_on_error = true;            // false: skip the bad bytes and keep going
};

struct StreamStats {
    std::array<uint64_t, MESSAGE_KIND_COUNT> decoded{};  // Indexed by MessageKind
    uint64_t bytes_consumed{0};   // Bytes of successfully decoded messages
    uint64_t bytes_discarded{0};  // Bytes skipped by discard() or error recovery
    uint64_t errors{0};           // Malformed, unrecognized and overflow failures
    DecodeError last_error{};     // Most recent of those, offset absolute; false if none

    [[nodiscard]] uint64_t count(MessageKind kind) const noexcept {
        return decoded[static_cast<size_t>(kind)];
    }

    [[nodiscard]] uint64_t total() const noexcept {
        return std::accumulate(decoded.begin(), decoded.end(), uint64_t{0});
    }
};

// ============================================================================
// StreamDecoder
// ============================================================================

template <TopsSymbol Symbol = std::string>
class StreamDecoder {
    // Delivered records must not point into the internal buffer, which is
    // compacted and reallocated between polls
    static_assert(!std::is_same_v<Symbol, std::string_view>,
                  "StreamDecoder requires an owning Symbol type");

public:
    using message_type = Message<Symbol>;

    explicit StreamDecoder(const StreamDecoderConfig& config = {})
        : config_(config) {
        buffer_.reserve(config_.initial_capacity);
    }

    StreamDecoder(const StreamDecoder&) = delete;
    StreamDecoder& operator=(const StreamDecoder&) = delete;
    StreamDecoder(StreamDecoder&&) noexcept = default;
    StreamDecoder& operator=(StreamDecoder&&) noexcept = default;

    // ========================================================================
    // Input
    // ========================================================================

    /// Append bytes. Fails with BufferOverflow, leaving the buffer as it
    /// was, when the unread bytes would exceed max_buffered.
    [[nodiscard]] DecodeResult<void> feed(ByteSpan bytes) {
        if (buffered() + bytes.size() > config_.max_buffered) {
            const DecodeError error{DecodeErrorCode::BufferOverflow, 0,
                                    stream_position(), buffered() + bytes.size()};
            record(error);
            IEX_LOG_WARN("tops stream buffer overflow: buffered={} incoming={} limit={}",
                         buffered(), bytes.size(), config_.max_buffered);
            return make_error(error);
        }
        if (read_pos_ > 0 && buffer_.size() + bytes.size() > buffer_.capacity()) {
            compact();
        }
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
        return {};
    }

    // ========================================================================
    // Output
    // ========================================================================

    /// Decode every complete buffered message and pass each one to
    /// handler(const Message<Symbol>&). Returns the number delivered.
    ///
    /// A trailing partial message is kept. On a malformed or unrecognized
    /// message the error is returned with its absolute stream offset; with
    /// stop_on_error the offending bytes stay at the front of the buffer
    /// (discard() or reset() to move on), otherwise they are skipped and
    /// decoding continues. In skip mode the error is returned only when
    /// nothing was delivered; every skipped failure is counted in
    /// stats().errors and the latest is kept in stats().last_error.
    template <typename Handler>
    [[nodiscard]] DecodeResult<size_t> poll(Handler&& handler) {
        size_t delivered = 0;
        DecodeError last_error{};

        while (read_pos_ < buffer_.size()) {
            const ByteSpan pending{buffer_.data() + read_pos_, buffer_.size() - read_pos_};
            auto result = decode_message<Symbol>(pending);

            if (result) [[likely]] {
                const size_t consumed = pending.size() - result->remaining.size();
                ++stats_.decoded[static_cast<size_t>(message_kind(result->value))];
                stats_.bytes_consumed += consumed;
                read_pos_ += consumed;
                ++delivered;
                handler(std::as_const(result->value));
                continue;
            }

            const DecodeError error = rebase(result.error(), stream_position());
            if (error.is_incomplete()) {
                break;
            }

            record(error);
            IEX_LOG_WARN("tops decode failed at stream offset {}: {} (tag=0x{:02X})",
                         error.offset, error.message(), error.tag);

            if (config_.stop_on_error) {
                compact();
                return make_error(error);
            }
            last_error = error;
            skip(resync_length(pending));
        }

        compact();
        IEX_LOG_DEBUG("tops poll delivered {} messages, {} bytes pending", delivered, buffered());
        if (last_error && delivered == 0) {
            return make_error(last_error);
        }
        return delivered;
    }

    /// Drop up to n unread bytes from the front of the buffer
    size_t discard(size_t n) noexcept {
        const size_t dropped = std::min(n, buffered());
        skip(dropped);
        return dropped;
    }

    /// Drop buffered bytes and statistics; the stream offset restarts at zero
    void reset() noexcept {
        buffer_.clear();
        read_pos_ = 0;
        base_offset_ = 0;
        stats_ = StreamStats{};
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size() - read_pos_; }
    [[nodiscard]] bool empty() const noexcept { return buffered() == 0; }

    /// Absolute offset of the next unread byte since construction or reset()
    [[nodiscard]] uint64_t stream_position() const noexcept { return base_offset_ + read_pos_; }

    [[nodiscard]] const StreamStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const StreamDecoderConfig& config() const noexcept { return config_; }

private:
    /// Bytes to step over after a failed decode: the whole message when its
    /// tag is known (length is fixed), one byte otherwise
    [[nodiscard]] static size_t resync_length(ByteSpan pending) noexcept {
        if (const MessageLayout* layout = find_layout(pending[0])) {
            return std::min(layout->total_size(), pending.size());
        }
        return 1;
    }

    void record(const DecodeError& error) noexcept {
        ++stats_.errors;
        stats_.last_error = error;
    }

    void skip(size_t n) noexcept {
        read_pos_ += n;
        stats_.bytes_discarded += n;
    }

    /// Move unread bytes to the front of the buffer
    void compact() noexcept {
        if (read_pos_ == 0) {
            return;
        }
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
        base_offset_ += read_pos_;
        read_pos_ = 0;
    }

    StreamDecoderConfig config_;
    std::vector<uint8_t> buffer_;
    size_t read_pos_{0};
    uint64_t base_offset_{0};  // Stream offset of buffer_[0]
    StreamStats stats_;
};

} // namespace iex::tops
