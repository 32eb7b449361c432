#include "peerlink/models/keys/ephemeral_key_pair.hpp"

namespace peerlink::transfer::models {
    EphemeralKeyPair::EphemeralKeyPair(
        crypto::SecureMemoryHandle secret_key_handle,
        std::vector<uint8_t> public_key)
        : secret_key_handle_(std::move(secret_key_handle))
          , public_key_(std::move(public_key)) {
    }

    void EphemeralKeyPair::Wipe() noexcept {
        secret_key_handle_.Reset();
    }
}
