#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include "peerlink/models/keys/session_key.hpp"
#include "peerlink/models/keys/shared_secret.hpp"

namespace peerlink::transfer::protocol {

/**
 * @brief Shared secret to session key
 *
 * SessionKey = HKDF-SHA256(
 *     ikm  = X25519 shared secret,
 *     salt = "PeerLink-Transfer-Salt-v1",
 *     info = "PeerLink-Transfer-v1",
 *     L    = 32)
 *
 * Deterministic: both peers derive the same key from the same secret.
 */
class KeyDerivation {
public:
    [[nodiscard]] static Result<models::SessionKey, TransferFailure> Derive(
        const models::SharedSecret& shared_secret);

private:
    KeyDerivation() = delete;
};

}  // namespace peerlink::transfer::protocol
