#include <catch2/catch_test_macros.hpp>
#include "peerlink/protocol/key_exchange_engine.hpp"
#include "peerlink/protocol/key_derivation.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include "peerlink/transport/loopback_link.hpp"
#include "helpers/test_vectors.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace peerlink::transfer;
using namespace peerlink::transfer::protocol;
using peerlink::transfer::crypto::SecureMemoryHandle;
using peerlink::transfer::crypto::SodiumInterop;
using peerlink::transfer::models::EphemeralKeyPair;
using peerlink::transfer::models::SessionKey;
using peerlink::transfer::models::SharedSecret;
using peerlink::transfer::test_helpers::FromHex;
using peerlink::transfer::transport::LinkSide;
using peerlink::transfer::transport::LoopbackLink;

namespace {

EphemeralKeyPair KeyPairFromHex(std::string_view secret_hex, std::string_view public_hex) {
    return EphemeralKeyPair(
        SecureMemoryHandle::FromBytes(FromHex(secret_hex)).Unwrap(),
        FromHex(public_hex));
}

std::vector<uint8_t> SecretBytes(const SharedSecret& secret) {
    return secret.GetHandle().ReadBytes(secret.GetHandle().Size()).Unwrap();
}

std::vector<uint8_t> KeyBytes(const SessionKey& key) {
    return key.GetHandle().ReadBytes(key.GetHandle().Size()).Unwrap();
}

}  // namespace

TEST_CASE("KeyExchangeEngine - Generate", "[handshake][keygen]") {
    auto first = KeyExchangeEngine::Generate();
    auto second = KeyExchangeEngine::Generate();
    REQUIRE(first.IsOk());
    REQUIRE(second.IsOk());
    REQUIRE(first.Unwrap().GetPublicKey().size() == kX25519PublicKeyBytes);
    REQUIRE(first.Unwrap().GetSecretKeyHandle().Size() == kX25519PrivateKeyBytes);
    REQUIRE_FALSE(first.Unwrap().IsWiped());
    REQUIRE(first.Unwrap().GetPublicKey() != second.Unwrap().GetPublicKey());
}

TEST_CASE("KeyExchangeEngine - RFC 7748 shared secret", "[handshake][interop]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto alice = KeyPairFromHex(
        "77076d0a7318a57d3c16c17251b26645df4c2f87ebc0992ab177fba51db92c2a",
        "8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a");
    const auto bob = KeyPairFromHex(
        "5dab087e624a8a4b79e17f8b83800ee66f3bb1292618b6fd1c2f8b27ff88e0eb",
        "de9edb7d7b7dc1b4d35b61c2ece435373f8343c85b78674dadfc7e146f882b4f");
    const auto expected = FromHex("4a5d9d5ba4ce2de1728e3bf480350f25e07e21c947d19e3376f09b3c1e161742");

    auto alice_secret = KeyExchangeEngine::DeriveSharedSecret(alice, bob.GetPublicKey());
    auto bob_secret = KeyExchangeEngine::DeriveSharedSecret(bob, alice.GetPublicKey());
    REQUIRE(alice_secret.IsOk());
    REQUIRE(bob_secret.IsOk());
    REQUIRE(SecretBytes(alice_secret.Unwrap()) == expected);
    REQUIRE(SecretBytes(bob_secret.Unwrap()) == expected);

    SECTION("Both sides derive the same session key, every time") {
        auto alice_key = KeyDerivation::Derive(alice_secret.Unwrap());
        auto bob_key = KeyDerivation::Derive(bob_secret.Unwrap());
        auto again = KeyDerivation::Derive(alice_secret.Unwrap());
        REQUIRE(alice_key.IsOk());
        REQUIRE(bob_key.IsOk());
        REQUIRE(KeyBytes(alice_key.Unwrap()).size() == kSessionKeyBytes);
        REQUIRE(KeyBytes(alice_key.Unwrap()) == KeyBytes(bob_key.Unwrap()));
        REQUIRE(KeyBytes(alice_key.Unwrap()) == KeyBytes(again.Unwrap()));
        REQUIRE(KeyBytes(alice_key.Unwrap()) != expected);
    }
}

TEST_CASE("KeyExchangeEngine - Fresh key pairs give distinct session keys", "[handshake]") {
    auto a1 = KeyExchangeEngine::Generate().Unwrap();
    auto b1 = KeyExchangeEngine::Generate().Unwrap();
    auto a2 = KeyExchangeEngine::Generate().Unwrap();
    auto b2 = KeyExchangeEngine::Generate().Unwrap();
    auto k1 = KeyDerivation::Derive(KeyExchangeEngine::DeriveSharedSecret(a1, b1.GetPublicKey()).Unwrap());
    auto k2 = KeyDerivation::Derive(KeyExchangeEngine::DeriveSharedSecret(a2, b2.GetPublicKey()).Unwrap());
    REQUIRE(KeyBytes(k1.Unwrap()) != KeyBytes(k2.Unwrap()));
}

TEST_CASE("KeyExchangeEngine - Rejected peer keys", "[handshake][security]") {
    auto local = KeyExchangeEngine::Generate().Unwrap();
    SECTION("Small-order point") {
        auto result = KeyExchangeEngine::DeriveSharedSecret(local, std::vector<uint8_t>(32, 0x00));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidPeerKey);
    }
    SECTION("Wrong length") {
        auto result = KeyExchangeEngine::DeriveSharedSecret(local, std::vector<uint8_t>(16, 0x09));
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidPeerKey);
    }
    SECTION("Reflected local key") {
        auto result = KeyExchangeEngine::DeriveSharedSecret(local, local.GetPublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidPeerKey);
        REQUIRE(result.UnwrapErr().message == ErrorMessages::REFLECTION_ATTACK);
    }
    SECTION("Wiped local key") {
        auto peer = KeyExchangeEngine::Generate().Unwrap();
        local.Wipe();
        auto result = KeyExchangeEngine::DeriveSharedSecret(local, peer.GetPublicKey());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidState);
    }
}

TEST_CASE("KeyExchangeEngine - ExchangePublicKeys", "[handshake][transport]") {
    auto config = configuration::TransferConfig::Aggressive();
    auto link = LoopbackLink::Create();
    auto a = link->Endpoint(LinkSide::A);
    auto b = link->Endpoint(LinkSide::B);
    const auto key_a = KeyExchangeEngine::Generate().Unwrap();
    const auto key_b = KeyExchangeEngine::Generate().Unwrap();
    std::atomic<bool> cancelled{false};

    SECTION("Either side may write first") {
        auto peer_of_a = std::async(std::launch::async, [&]() {
            return KeyExchangeEngine::ExchangePublicKeys(*a, key_a, config, cancelled);
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        auto peer_of_b = KeyExchangeEngine::ExchangePublicKeys(*b, key_b, config, cancelled);
        auto result_a = peer_of_a.get();
        REQUIRE(result_a.IsOk());
        REQUIRE(peer_of_b.IsOk());
        REQUIRE(result_a.Unwrap() == key_b.GetPublicKey());
        REQUIRE(peer_of_b.Unwrap() == key_a.GetPublicKey());
    }
    SECTION("Base64 handshake messages") {
        config.transport_encoding = configuration::TransportEncoding::Base64;
        auto peer_of_a = std::async(std::launch::async, [&]() {
            return KeyExchangeEngine::ExchangePublicKeys(*a, key_a, config, cancelled);
        });
        auto peer_of_b = KeyExchangeEngine::ExchangePublicKeys(*b, key_b, config, cancelled);
        REQUIRE(peer_of_a.get().Unwrap() == key_b.GetPublicKey());
        REQUIRE(peer_of_b.Unwrap() == key_a.GetPublicKey());
    }
    SECTION("Silent peer times out") {
        config.handshake_timeout = std::chrono::milliseconds(50);
        auto result = KeyExchangeEngine::ExchangePublicKeys(*a, key_a, config, cancelled);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::HandshakeTimeout);
    }
    SECTION("Truncated peer key") {
        REQUIRE(b->Write(std::vector<uint8_t>(31, 0x09)).IsOk());
        auto result = KeyExchangeEngine::ExchangePublicKeys(*a, key_a, config, cancelled);
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidPeerKey);
    }
    SECTION("Cancellation stops polling") {
        cancelled.store(true);
        auto result = KeyExchangeEngine::ExchangePublicKeys(*a, key_a, config, cancelled);
        REQUIRE(result.UnwrapErr().type == TransferFailureType::TransportError);
    }
    SECTION("Disconnected link") {
        link->Disconnect();
        auto result = KeyExchangeEngine::ExchangePublicKeys(*a, key_a, config, cancelled);
        REQUIRE(result.UnwrapErr().type == TransferFailureType::TransportError);
    }
}
