#include "peerlink/protocol/inbound_channel.hpp"
#include "peerlink/core/format.hpp"

namespace peerlink::transfer::protocol {

    void InboundChannel::Push(std::span<const uint8_t> message) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return;
            }
            queue_.emplace_back(message.begin(), message.end());
        }
        cv_.notify_one();
    }

    Result<std::vector<uint8_t>, TransferFailure> InboundChannel::Receive(
        const std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);

        const bool ready = cv_.wait_for(lock, timeout,
            [this] { return closed_ || !queue_.empty(); });

        if (closed_) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::TransportError(close_reason_));
        }
        if (!ready) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::FrameTimeout(
                    compat::format("No inbound message within {} ms", timeout.count())));
        }

        auto message = std::move(queue_.front());
        queue_.pop_front();
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(message));
    }

    void InboundChannel::Close(std::string reason) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            close_reason_ = std::move(reason);
            queue_.clear();
        }
        cv_.notify_all();
    }

    bool InboundChannel::IsClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    size_t InboundChannel::Pending() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

}
