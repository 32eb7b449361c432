#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include "peerlink/configuration/transfer_config.hpp"
#include "peerlink/interfaces/i_transport.hpp"
#include "peerlink/models/keys/ephemeral_key_pair.hpp"
#include "peerlink/models/keys/shared_secret.hpp"
#include <atomic>
#include <cstdint>
#include <span>
#include <vector>

namespace peerlink::transfer::protocol {

/**
 * @brief Ephemeral X25519 agreement between two previously unknown peers
 *
 * Each side generates a fresh key pair per session, writes its public key to
 * the handshake channel and reads the peer's. Nothing is signed: the exchange
 * gives forward secrecy but no peer authentication.
 */
class KeyExchangeEngine {
public:
    [[nodiscard]] static Result<models::EphemeralKeyPair, TransferFailure> Generate();

    /**
     * @brief X25519(local secret, peer public)
     *
     * @return Err(InvalidPeerKey) if the peer key fails DhValidator, equals
     *         the local public key, or yields an all-zero secret
     */
    [[nodiscard]] static Result<models::SharedSecret, TransferFailure> DeriveSharedSecret(
        const models::EphemeralKeyPair& local_key_pair,
        std::span<const uint8_t> peer_public_key);

    /**
     * @brief Two-message public key exchange over the handshake channel
     *
     * Writes the local public key, then polls Read() every
     * config.handshake_poll_interval until the peer's key shows up. The write
     * and the peer's write may happen in either order.
     *
     * @return the peer's raw public key (size checked, not yet validated);
     *         Err(HandshakeTimeout) after config.handshake_timeout;
     *         Err(TransportError) on a channel failure, disconnect, or when
     *         @p cancelled becomes true
     */
    [[nodiscard]] static Result<std::vector<uint8_t>, TransferFailure> ExchangePublicKeys(
        interfaces::ITransport& transport,
        const models::EphemeralKeyPair& local_key_pair,
        const configuration::TransferConfig& config,
        const std::atomic<bool>& cancelled);

private:
    KeyExchangeEngine() = delete;
};

}  // namespace peerlink::transfer::protocol
