#pragma once

#include "wscls/channel/message.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// Message Channel Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// What emit() does when the buffer already holds `capacity` messages.
/// Neither policy ever blocks the producer (the transport read loop).
enum class OverflowPolicy : std::uint8_t {
    DropOldest,  ///< Discard the oldest buffered message to make room
    DropNewest   ///< Discard the message being emitted
};

struct MessageChannelConfig {
    std::size_t capacity{4096};
    OverflowPolicy overflow{OverflowPolicy::DropOldest};
};

struct MessageChannelStats {
    std::size_t emitted{0};   ///< Calls to emit()
    std::size_t dropped{0};   ///< Messages discarded by the overflow policy
    std::size_t buffered{0};  ///< Messages waiting for a consumer
};

// ─────────────────────────────────────────────────────────────────────────────
// MessageChannel
// ─────────────────────────────────────────────────────────────────────────────
// Bounded hand-off between the connection engine (producer) and the log
// collaborator (consumer). emit() is called exactly once per frame in the
// order frames cross the boundary; consumers read them back in that order.
//
// Overflow is handled by the configured OverflowPolicy and reported as a
// warning on the first drop and every 1000th drop after it.

class MessageChannel {
public:
    MessageChannel() = default;
    explicit MessageChannel(MessageChannelConfig config);

    MessageChannel(const MessageChannel&) = delete;
    MessageChannel& operator=(const MessageChannel&) = delete;

    /// Record a frame. Never blocks. Ignored after close().
    void emit(
        Direction direction,
        FrameKind kind,
        std::string payload,
        std::optional<std::chrono::microseconds> round_trip = std::nullopt
    );

    /// Pop the oldest message if one is buffered.
    [[nodiscard]] std::optional<Message> try_receive();

    /// Wait up to `timeout` for a message. Returns nullopt on timeout or when
    /// the channel is closed and empty.
    [[nodiscard]] std::optional<Message> receive_for(std::chrono::milliseconds timeout);

    /// Pop everything currently buffered.
    [[nodiscard]] std::vector<Message> drain();

    /// Stop accepting messages and wake all waiting consumers.
    void close();

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] MessageChannelStats stats() const;
    [[nodiscard]] const MessageChannelConfig& config() const noexcept { return config_; }

private:
    MessageChannelConfig config_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Message> buffer_;
    bool closed_{false};
    std::size_t emitted_{0};
    std::size_t dropped_{0};
};

}  // namespace wscls
