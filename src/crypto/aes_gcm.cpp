#include "peerlink/crypto/aes_gcm.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include "peerlink/core/constants.hpp"
#include "peerlink/core/format.hpp"
#include "peerlink/protocol/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <algorithm>
#include <memory>
#include <string>
namespace peerlink::transfer::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[OpenSSL::ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    void WipeQuietly(std::vector<uint8_t>& buffer) {
        // Only fails when libsodium is not initialized; fall back to a plain clear.
        if (SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsErr()) {
            std::fill(buffer.begin(), buffer.end(), uint8_t{0});
        }
    }
    Result<Unit, TransferFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                        kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, TransferFailure>
AesGcm::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(std::move(check).UnwrapErr());
    }
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                         plaintext.data(),
                         static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, TransferFailure>
AesGcm::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = ValidateKeyAndNonce(key, nonce); check.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(std::move(check).UnwrapErr());
    }
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), kAesGcmTagBytes)));
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                           static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set nonce length: {}", GetOpenSSLError())));
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set key and nonce: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                             associated_data.data(),
                             static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::Generic(
                    compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    // One spare byte keeps data() non-null for an empty frame.
    std::vector<uint8_t> output(std::max<size_t>(ciphertext_len, 1));
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                         ciphertext.data(),
                         static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Decryption failed: {}", GetOpenSSLError())));
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                           static_cast<int>(kAesGcmTagBytes),
                           tag_copy.data()) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Failed to set authentication tag: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        WipeQuietly(output);
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::AuthenticationFailure(
                std::string(ErrorMessages::AES_GCM_DECRYPTION_FAILED)));
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(output));
}
}
