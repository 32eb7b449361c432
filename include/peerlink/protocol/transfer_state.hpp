#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace peerlink::transfer {

enum class TransferState {
    Idle,
    ExchangingKeys,
    Ready,
    Sending,
    Receiving,
    Complete,
    Failed
};

enum class TransferRole {
    Sender,
    Receiver
};

[[nodiscard]] std::string_view ToString(TransferState state) noexcept;
[[nodiscard]] std::string_view ToString(TransferRole role) noexcept;

[[nodiscard]] constexpr bool IsTerminal(TransferState state) noexcept {
    return state == TransferState::Complete || state == TransferState::Failed;
}

/**
 * @brief Counters kept by a TransferSession; readable after it ends
 */
struct TransferStatistics {
    uint32_t frames_sent = 0;
    uint32_t frames_received = 0;
    uint32_t acks_sent = 0;
    uint32_t acks_received = 0;
    uint32_t retransmissions = 0;
    uint32_t duplicate_frames = 0;
    uint32_t dropped_frames = 0;
    uint64_t payload_bytes = 0;
};

}
