#pragma once
#include "peerlink/crypto/sodium_secure_memory_handle.hpp"
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include <cstdint>
#include <span>
namespace peerlink::transfer::models {

/**
 * @brief 32-byte AES-256-GCM key shared by both peers for one session
 *
 * Immutable once derived. Callers reach the bytes through
 * GetHandle().WithReadAccess() so the key never leaves secure memory.
 */
class SessionKey {
public:
    explicit SessionKey(crypto::SecureMemoryHandle handle);

    /**
     * @brief Build a session key from raw bytes (must be kSessionKeyBytes)
     */
    static Result<SessionKey, TransferFailure> FromBytes(std::span<const uint8_t> key_bytes);

    SessionKey(SessionKey&&) noexcept = default;
    SessionKey& operator=(SessionKey&&) noexcept = default;
    SessionKey(const SessionKey&) = delete;
    SessionKey& operator=(const SessionKey&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetHandle() const noexcept {
        return handle_;
    }
    [[nodiscard]] bool IsWiped() const noexcept {
        return handle_.IsInvalid();
    }
    void Wipe() noexcept {
        handle_.Reset();
    }
private:
    crypto::SecureMemoryHandle handle_;
};
}
