#pragma once
#include "peerlink/protocol/frame.hpp"
#include <cstdint>
#include <span>

namespace peerlink::transfer::protocol {

/**
 * @brief Deterministic per-frame AES-GCM nonce
 *
 * nonce = "PLKFRAME" || sequence_number (4 bytes, big-endian)
 *
 * The session key is fresh for every session and sequence numbers never
 * repeat within one, so each (key, nonce) pair is used for one frame only.
 */
class FrameNonce {
public:
    [[nodiscard]] static FrameNonceBytes ForSequence(uint32_t sequence_number) noexcept;

    /// True if @p nonce is exactly the nonce ForSequence(sequence_number) would produce
    [[nodiscard]] static bool Matches(std::span<const uint8_t> nonce, uint32_t sequence_number) noexcept;

private:
    FrameNonce() = delete;
};

}  // namespace peerlink::transfer::protocol
