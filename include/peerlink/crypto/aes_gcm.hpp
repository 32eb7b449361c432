#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace peerlink::transfer::crypto {

/**
 * AES-256-GCM Authenticated Encryption with Associated Data (AEAD)
 *
 * Stateless primitive: the caller MUST ensure that a (key, nonce) pair is never
 * used for two encryptions. Reuse leaks the XOR of the plaintexts and lets an
 * attacker recover the GHASH key and forge tags.
 *
 * Within a transfer session the nonce is the fixed frame prefix followed by the
 * 32-bit frame sequence number, and the session key is fresh per session, so
 * uniqueness holds as long as sequence numbers never repeat for fresh content.
 * A retransmission re-sends the previously produced bytes and does not call
 * Encrypt() again.
 *
 * Output of Encrypt() is ciphertext || tag (16 bytes). Decrypt() is all or
 * nothing: on tag mismatch the partial plaintext is wiped and
 * AuthenticationFailure is returned.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
