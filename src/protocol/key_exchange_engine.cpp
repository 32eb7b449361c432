#include "peerlink/protocol/key_exchange_engine.hpp"
#include "peerlink/protocol/frame_codec.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include "peerlink/security/validation/dh_validator.hpp"
#include "peerlink/core/constants.hpp"
#include "peerlink/core/format.hpp"
#include <sodium.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

namespace peerlink::transfer::protocol {

    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using models::EphemeralKeyPair;
    using models::SharedSecret;
    using security::DhValidator;

    Result<EphemeralKeyPair, TransferFailure> KeyExchangeEngine::Generate() {
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<EphemeralKeyPair, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        auto secret = SodiumInterop::GetRandomBytes(kX25519PrivateKeyBytes);
        std::vector<uint8_t> public_key(kX25519PublicKeyBytes);
        if (crypto_scalarmult_base(public_key.data(), secret.data()) != SodiumConstants::SUCCESS) {
            (void)SodiumInterop::SecureWipe(std::span(secret));
            return Result<EphemeralKeyPair, TransferFailure>::Err(
                TransferFailure::KeyGeneration("Failed to derive X25519 public key"));
        }

        auto handle_result = SecureMemoryHandle::FromBytes(secret);
        (void)SodiumInterop::SecureWipe(std::span(secret));
        if (handle_result.IsErr()) {
            return Result<EphemeralKeyPair, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }

        return Result<EphemeralKeyPair, TransferFailure>::Ok(
            EphemeralKeyPair(std::move(handle_result).Unwrap(), std::move(public_key)));
    }

    Result<SharedSecret, TransferFailure> KeyExchangeEngine::DeriveSharedSecret(
        const EphemeralKeyPair& local_key_pair,
        std::span<const uint8_t> peer_public_key) {
        if (local_key_pair.IsWiped()) {
            return Result<SharedSecret, TransferFailure>::Err(
                TransferFailure::InvalidState("Ephemeral secret key has been wiped"));
        }

        if (auto valid = DhValidator::ValidateX25519PublicKey(peer_public_key); valid.IsErr()) {
            return Result<SharedSecret, TransferFailure>::Err(std::move(valid).UnwrapErr());
        }

        auto reflected = SodiumInterop::ConstantTimeEquals(
            peer_public_key, local_key_pair.GetPublicKey());
        if (reflected.IsErr()) {
            return Result<SharedSecret, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(reflected.UnwrapErr()));
        }
        if (reflected.Unwrap()) {
            return Result<SharedSecret, TransferFailure>::Err(
                TransferFailure::InvalidPeerKey(std::string(ErrorMessages::REFLECTION_ATTACK)));
        }

        std::vector<uint8_t> shared(kX25519SharedSecretBytes);
        auto dh = local_key_pair.GetSecretKeyHandle().WithReadAccess(
            [&](std::span<const uint8_t> secret_key) {
                return crypto_scalarmult(shared.data(), secret_key.data(), peer_public_key.data());
            });
        if (dh.IsErr()) {
            return Result<SharedSecret, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(dh.UnwrapErr()));
        }
        if (dh.Unwrap() != SodiumConstants::SUCCESS) {
            (void)SodiumInterop::SecureWipe(std::span(shared));
            return Result<SharedSecret, TransferFailure>::Err(
                TransferFailure::InvalidPeerKey("X25519 produced an all-zero shared secret"));
        }

        auto handle_result = SecureMemoryHandle::FromBytes(shared);
        (void)SodiumInterop::SecureWipe(std::span(shared));
        if (handle_result.IsErr()) {
            return Result<SharedSecret, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<SharedSecret, TransferFailure>::Ok(
            SharedSecret(std::move(handle_result).Unwrap()));
    }

    Result<std::vector<uint8_t>, TransferFailure> KeyExchangeEngine::ExchangePublicKeys(
        interfaces::ITransport& transport,
        const EphemeralKeyPair& local_key_pair,
        const configuration::TransferConfig& config,
        const std::atomic<bool>& cancelled) {
        using Clock = std::chrono::steady_clock;

        const auto outbound = FrameCodec::EncodeForTransport(
            local_key_pair.GetPublicKey(), config.transport_encoding);
        if (auto written = transport.Write(outbound); written.IsErr()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::TransportError(
                    "Handshake write failed: " + written.UnwrapErr().message));
        }

        const auto deadline = Clock::now() + config.handshake_timeout;
        while (true) {
            if (cancelled.load(std::memory_order_acquire)) {
                return Result<std::vector<uint8_t>, TransferFailure>::Err(
                    TransferFailure::TransportError(std::string(ErrorMessages::SESSION_CANCELLED)));
            }
            if (!transport.IsConnected()) {
                return Result<std::vector<uint8_t>, TransferFailure>::Err(
                    TransferFailure::TransportError(std::string(ErrorMessages::SESSION_DISCONNECTED)));
            }

            auto read = transport.Read();
            if (read.IsErr()) {
                return Result<std::vector<uint8_t>, TransferFailure>::Err(
                    TransferFailure::TransportError(
                        "Handshake read failed: " + read.UnwrapErr().message));
            }
            auto inbound = std::move(read).Unwrap();
            if (!inbound.empty()) {
                auto decoded = FrameCodec::DecodeFromTransport(inbound, config.transport_encoding);
                if (decoded.IsErr()) {
                    return Result<std::vector<uint8_t>, TransferFailure>::Err(
                        TransferFailure::InvalidPeerKey(
                            "Malformed handshake message: " + decoded.UnwrapErr().message));
                }
                auto peer_key = std::move(decoded).Unwrap();
                if (peer_key.size() != kX25519PublicKeyBytes) {
                    return Result<std::vector<uint8_t>, TransferFailure>::Err(
                        TransferFailure::InvalidPeerKey(
                            compat::format("Peer public key must be {} bytes, got {}",
                                kX25519PublicKeyBytes, peer_key.size())));
                }
                return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(peer_key));
            }

            const auto now = Clock::now();
            if (now >= deadline) {
                break;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(config.handshake_poll_interval, remaining));
        }

        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::HandshakeTimeout(
                compat::format("No peer public key within {} ms", config.handshake_timeout.count())));
    }

}
