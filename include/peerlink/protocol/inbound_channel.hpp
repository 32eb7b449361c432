#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace peerlink::transfer::protocol {

/**
 * @brief Ordered hand-off of transfer-channel notifications to the session
 *
 * The transport's notification callback calls Push() from whatever thread it
 * runs on; the session pulls with Receive(). Each message is delivered
 * exactly once, in arrival order.
 *
 * Close() is terminal: blocked and future Receive() calls return
 * TransportError and pending messages are dropped.
 */
class InboundChannel {
public:
    InboundChannel() = default;
    InboundChannel(const InboundChannel&) = delete;
    InboundChannel& operator=(const InboundChannel&) = delete;

    void Push(std::span<const uint8_t> message);

    /**
     * @return the next message, Err(FrameTimeout) if none arrives within
     *         @p timeout, Err(TransportError) once closed
     */
    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Receive(std::chrono::milliseconds timeout);

    void Close(std::string reason);

    [[nodiscard]] bool IsClosed() const;

    [[nodiscard]] size_t Pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::vector<uint8_t>> queue_;
    bool closed_ = false;
    std::string close_reason_;
};

}  // namespace peerlink::transfer::protocol
