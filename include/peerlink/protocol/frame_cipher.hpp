#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include "peerlink/models/keys/session_key.hpp"
#include "peerlink/protocol/frame.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace peerlink::transfer::protocol {

/**
 * @brief AES-256-GCM encryption of one frame payload under the session key
 *
 * The nonce is derived from the sequence number (FrameNonce) and the frame
 * header is bound as associated data, so flipping the sequence number or the
 * is_last flag on the wire makes DecryptFrame() fail.
 */
class FrameCipher {
public:
    [[nodiscard]] static Result<Frame, TransferFailure> EncryptFrame(
        uint32_t sequence_number,
        bool is_last,
        std::span<const uint8_t> plaintext,
        const models::SessionKey& session_key);

    /**
     * @brief Verify and decrypt; all or nothing
     *
     * @return Err(AuthenticationFailure) if the tag does not verify or the
     *         nonce does not belong to the frame's sequence number
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> DecryptFrame(
        const Frame& frame,
        const models::SessionKey& session_key);

private:
    FrameCipher() = delete;
};

}  // namespace peerlink::transfer::protocol
