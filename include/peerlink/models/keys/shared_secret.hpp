#pragma once
#include "peerlink/crypto/sodium_secure_memory_handle.hpp"
namespace peerlink::transfer::models {

/**
 * @brief Raw X25519 output; lives only long enough to feed the KDF
 */
class SharedSecret {
public:
    explicit SharedSecret(crypto::SecureMemoryHandle handle);
    SharedSecret(SharedSecret&&) noexcept = default;
    SharedSecret& operator=(SharedSecret&&) noexcept = default;
    SharedSecret(const SharedSecret&) = delete;
    SharedSecret& operator=(const SharedSecret&) = delete;
    [[nodiscard]] const crypto::SecureMemoryHandle& GetHandle() const noexcept {
        return handle_;
    }
private:
    crypto::SecureMemoryHandle handle_;
};
}
