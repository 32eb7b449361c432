#include "peerlink/protocol/key_derivation.hpp"
#include "peerlink/protocol/constants.hpp"
#include "peerlink/crypto/hkdf.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include <vector>

namespace peerlink::transfer::protocol {

    using crypto::Hkdf;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;

    namespace {
        std::span<const uint8_t> AsBytes(std::string_view label) {
            return {reinterpret_cast<const uint8_t*>(label.data()), label.size()};
        }
    }

    Result<models::SessionKey, TransferFailure> KeyDerivation::Derive(
        const models::SharedSecret& shared_secret) {
        std::vector<uint8_t> key_bytes(kSessionKeyBytes);

        auto derived = shared_secret.GetHandle().WithReadAccess(
            [&](std::span<const uint8_t> ikm) {
                return Hkdf::DeriveKey(ikm, key_bytes, AsBytes(kSessionKeySalt), AsBytes(kSessionKeyInfo));
            });
        if (derived.IsErr()) {
            return Result<models::SessionKey, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(derived.UnwrapErr()));
        }
        if (auto hkdf = std::move(derived).Unwrap(); hkdf.IsErr()) {
            (void)SodiumInterop::SecureWipe(std::span(key_bytes));
            return Result<models::SessionKey, TransferFailure>::Err(std::move(hkdf).UnwrapErr());
        }

        auto handle_result = SecureMemoryHandle::FromBytes(key_bytes);
        (void)SodiumInterop::SecureWipe(std::span(key_bytes));
        if (handle_result.IsErr()) {
            return Result<models::SessionKey, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<models::SessionKey, TransferFailure>::Ok(
            models::SessionKey(std::move(handle_result).Unwrap()));
    }

}
