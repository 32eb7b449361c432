#pragma once
#include "peerlink/protocol/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace peerlink::transfer::protocol {

using FrameNonceBytes = std::array<uint8_t, kAesGcmNonceBytes>;
using FrameTagBytes = std::array<uint8_t, kAesGcmTagBytes>;
using FrameHeaderBytes = std::array<uint8_t, kFrameHeaderBytes>;

/**
 * @brief One encrypted chunk of the transferred stream
 *
 * Wire layout (see FrameCodec):
 *   [sequence_number:4 BE][flags:1][nonce:12][ciphertext][auth_tag:16]
 *
 * The 5-byte header (sequence_number || flags) is the AES-GCM associated data.
 */
struct Frame {
    uint32_t sequence_number = 0;
    bool is_last = false;
    FrameNonceBytes nonce{};
    std::vector<uint8_t> ciphertext;
    FrameTagBytes auth_tag{};

    [[nodiscard]] uint8_t Flags() const noexcept {
        return is_last ? kFlagIsLast : uint8_t{0};
    }

    [[nodiscard]] FrameHeaderBytes Header() const noexcept;

    [[nodiscard]] size_t WireSize() const noexcept {
        return kFrameOverheadBytes + ciphertext.size();
    }
};

struct Acknowledgment {
    uint32_t sequence_number = 0;
};

inline void StoreBigEndian32(const uint32_t value, std::span<uint8_t, 4> out) noexcept {
    out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(value & 0xFF);
}

[[nodiscard]] inline uint32_t LoadBigEndian32(std::span<const uint8_t, 4> in) noexcept {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

}  // namespace peerlink::transfer::protocol
