#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include "peerlink/configuration/transfer_config.hpp"
#include "peerlink/protocol/frame.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace peerlink::transfer::protocol {

using configuration::TransportEncoding;

/**
 * @brief Byte layout of frames and acknowledgments
 *
 * Frame:          [sequence_number:4 BE][flags:1][nonce:12][ciphertext][auth_tag:16]
 * Acknowledgment: [sequence_number:4 BE]
 *
 * Only bit 0 of flags (is_last) is defined; a frame with any other bit set
 * is rejected. When the channel is text-only the serialized bytes are
 * additionally passed through EncodeForTransport().
 */
class FrameCodec {
public:
    /**
     * @param max_frame_bytes Budget for the serialized (pre-transport-encoding) frame
     * @return Err(Encode) if the frame does not fit
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> Serialize(
        const Frame& frame,
        size_t max_frame_bytes);

    [[nodiscard]] static Result<Frame, TransferFailure> Parse(std::span<const uint8_t> bytes);

    [[nodiscard]] static std::array<uint8_t, kAckBytes> SerializeAck(const Acknowledgment& ack) noexcept;

    [[nodiscard]] static Result<Acknowledgment, TransferFailure> ParseAck(std::span<const uint8_t> bytes);

    /// Serialized-frame budget left after transport encoding of a @p max_payload byte write
    [[nodiscard]] static size_t FrameBudget(size_t max_payload, TransportEncoding encoding) noexcept;

    /// Largest plaintext such that header + nonce + ciphertext + tag
    /// (and its transport encoding) fits in @p max_payload.
    /// Err(InvalidInput) if not even one plaintext byte fits.
    [[nodiscard]] static Result<size_t, TransferFailure> MaxPlaintextChunk(
        size_t max_payload,
        TransportEncoding encoding = TransportEncoding::Binary);

    [[nodiscard]] static std::vector<uint8_t> EncodeForTransport(
        std::span<const uint8_t> bytes,
        TransportEncoding encoding);

    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> DecodeFromTransport(
        std::span<const uint8_t> bytes,
        TransportEncoding encoding);

private:
    FrameCodec() = delete;
};

}  // namespace peerlink::transfer::protocol
