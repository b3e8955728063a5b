#include "wscls/channel/message_channel.hpp"
#include "wscls/log/logger.hpp"

#include <algorithm>

namespace wscls {

namespace {

constexpr std::size_t kDropWarningInterval = 1000;

}  // namespace

MessageChannel::MessageChannel(MessageChannelConfig config)
    : config_(std::move(config))
{
    // A zero capacity would drop every frame
    config_.capacity = std::max<std::size_t>(config_.capacity, 1);
}

void MessageChannel::emit(
    Direction direction,
    FrameKind kind,
    std::string payload,
    std::optional<std::chrono::microseconds> round_trip
) {
    std::size_t dropped_total = 0;
    bool warn = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }

        ++emitted_;

        bool keep = true;
        const bool full = (buffer_.size() >= config_.capacity);
        if (full) {
            ++dropped_;
            dropped_total = dropped_;
            warn = (dropped_ % kDropWarningInterval) == 1;

            if (config_.overflow == OverflowPolicy::DropNewest) {
                keep = false;
            } else {
                buffer_.pop_front();
            }
        }

        if (keep) {
            buffer_.push_back(Message{
                .direction = direction,
                .kind = kind,
                .payload = std::move(payload),
                .timestamp = std::chrono::system_clock::now(),
                .round_trip = round_trip
            });
        }
    }

    cv_.notify_one();

    if (warn) {
        get_logger().warn_fmt(
            "Message channel full (capacity {}), {} message(s) dropped so far",
            config_.capacity, dropped_total);
    }
}

std::optional<Message> MessageChannel::try_receive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_.empty()) {
        return std::nullopt;
    }
    Message message = std::move(buffer_.front());
    buffer_.pop_front();
    return message;
}

std::optional<Message> MessageChannel::receive_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    const bool ready = cv_.wait_for(lock, timeout, [this]() {
        const bool has_message = (buffer_.empty() == false);
        return has_message || closed_;
    });

    const bool has_message = ready && (buffer_.empty() == false);
    if (has_message == false) {
        return std::nullopt;
    }

    Message message = std::move(buffer_.front());
    buffer_.pop_front();
    return message;
}

std::vector<Message> MessageChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> messages;
    messages.reserve(buffer_.size());
    for (auto& message : buffer_) {
        messages.push_back(std::move(message));
    }
    buffer_.clear();
    return messages;
}

void MessageChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool MessageChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

MessageChannelStats MessageChannel::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return MessageChannelStats{
        .emitted = emitted_,
        .dropped = dropped_,
        .buffered = buffer_.size()
    };
}

}  // namespace wscls
