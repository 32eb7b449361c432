#pragma once
#include "peerlink/crypto/sodium_secure_memory_handle.hpp"
#include <vector>
#include <cstdint>
namespace peerlink::transfer::models {

/**
 * @brief Per-session X25519 key pair
 *
 * Created fresh by KeyExchangeEngine::Generate() for every session and owned
 * by exactly one TransferSession. The secret half stays in secure memory and
 * is released by Wipe() or destruction; it is never copied out.
 */
class EphemeralKeyPair {
public:
    EphemeralKeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key);
    EphemeralKeyPair(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair& operator=(EphemeralKeyPair&&) noexcept = default;
    EphemeralKeyPair(const EphemeralKeyPair&) = delete;
    EphemeralKeyPair& operator=(const EphemeralKeyPair&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetSecretKeyHandle() const noexcept {
        return secret_key_handle_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept {
        return public_key_;
    }
    [[nodiscard]] bool IsWiped() const noexcept {
        return secret_key_handle_.IsInvalid();
    }
    void Wipe() noexcept;
private:
    crypto::SecureMemoryHandle secret_key_handle_;
    std::vector<uint8_t> public_key_;
};
}
