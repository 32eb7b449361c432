#include "peerlink/models/keys/session_key.hpp"
#include "peerlink/core/format.hpp"
#include "peerlink/protocol/constants.hpp"

namespace peerlink::transfer::models {
    SessionKey::SessionKey(crypto::SecureMemoryHandle handle)
        : handle_(std::move(handle)) {
    }

    Result<SessionKey, TransferFailure> SessionKey::FromBytes(std::span<const uint8_t> key_bytes) {
        if (key_bytes.size() != kSessionKeyBytes) {
            return Result<SessionKey, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    compat::format("Session key must be {} bytes, got {}",
                        kSessionKeyBytes, key_bytes.size())));
        }
        auto handle_result = crypto::SecureMemoryHandle::FromBytes(key_bytes);
        if (handle_result.IsErr()) {
            return Result<SessionKey, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(handle_result.UnwrapErr()));
        }
        return Result<SessionKey, TransferFailure>::Ok(
            SessionKey(std::move(handle_result).Unwrap()));
    }
}
