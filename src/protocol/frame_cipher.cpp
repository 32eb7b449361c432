#include "peerlink/protocol/frame_cipher.hpp"
#include "peerlink/protocol/nonce.hpp"
#include "peerlink/crypto/aes_gcm.hpp"
#include "peerlink/core/format.hpp"
#include <algorithm>

namespace peerlink::transfer::protocol {

    using crypto::AesGcm;

    Result<Frame, TransferFailure> FrameCipher::EncryptFrame(
        const uint32_t sequence_number,
        const bool is_last,
        std::span<const uint8_t> plaintext,
        const models::SessionKey& session_key) {
        if (session_key.IsWiped()) {
            return Result<Frame, TransferFailure>::Err(
                TransferFailure::InvalidState("Session key has been wiped"));
        }

        Frame frame;
        frame.sequence_number = sequence_number;
        frame.is_last = is_last;
        frame.nonce = FrameNonce::ForSequence(sequence_number);
        const auto header = frame.Header();

        auto sealed = session_key.GetHandle().WithReadAccess(
            [&](std::span<const uint8_t> key) {
                return AesGcm::Encrypt(key, frame.nonce, plaintext, header);
            });
        if (sealed.IsErr()) {
            return Result<Frame, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(sealed.UnwrapErr()));
        }
        auto encrypted = std::move(sealed).Unwrap();
        if (encrypted.IsErr()) {
            return Result<Frame, TransferFailure>::Err(std::move(encrypted).UnwrapErr());
        }
        auto ciphertext_with_tag = std::move(encrypted).Unwrap();

        const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
        std::copy(ciphertext_with_tag.begin() + static_cast<std::ptrdiff_t>(ciphertext_len),
                  ciphertext_with_tag.end(),
                  frame.auth_tag.begin());
        ciphertext_with_tag.resize(ciphertext_len);
        frame.ciphertext = std::move(ciphertext_with_tag);

        return Result<Frame, TransferFailure>::Ok(std::move(frame));
    }

    Result<std::vector<uint8_t>, TransferFailure> FrameCipher::DecryptFrame(
        const Frame& frame,
        const models::SessionKey& session_key) {
        if (session_key.IsWiped()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::InvalidState("Session key has been wiped"));
        }
        if (!FrameNonce::Matches(frame.nonce, frame.sequence_number)) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::AuthenticationFailure(
                    compat::format("Nonce does not match frame sequence number {}",
                        frame.sequence_number)));
        }

        std::vector<uint8_t> sealed;
        sealed.reserve(frame.ciphertext.size() + kAesGcmTagBytes);
        sealed.insert(sealed.end(), frame.ciphertext.begin(), frame.ciphertext.end());
        sealed.insert(sealed.end(), frame.auth_tag.begin(), frame.auth_tag.end());
        const auto header = frame.Header();

        auto opened = session_key.GetHandle().WithReadAccess(
            [&](std::span<const uint8_t> key) {
                return AesGcm::Decrypt(key, frame.nonce, sealed, header);
            });
        if (opened.IsErr()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(opened.UnwrapErr()));
        }
        return std::move(opened).Unwrap();
    }

}
