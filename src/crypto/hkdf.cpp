#include "peerlink/crypto/hkdf.hpp"
#include "peerlink/core/constants.hpp"
#include "peerlink/core/format.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <memory>
#include <string>

namespace peerlink::transfer::crypto {

namespace {
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, TransferFailure> Hkdf::RunKdf(
    int mode,
    std::span<const uint8_t> key,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    try {
        EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr);
        if (!kdf) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("Failed to fetch HKDF algorithm"));
        }

        EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf));
        EVP_KDF_free(kdf);

        if (!kctx) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("Failed to create HKDF context"));
        }

        OSSL_PARAM params[6];
        int param_idx = 0;

        params[param_idx++] = OSSL_PARAM_construct_utf8_string(
            OSSL_KDF_PARAM_DIGEST,
            const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);
        params[param_idx++] = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_MODE, &mode);
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(key.data()), key.size());

        if (!salt.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
        }
        if (!info.empty()) {
            params[param_idx++] = OSSL_PARAM_construct_octet_string(
                OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
        }
        params[param_idx] = OSSL_PARAM_construct_end();

        if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::DeriveKey("HKDF key derivation failed"));
        }

        return Result<Unit, TransferFailure>::Ok(unit);

    } catch (const std::exception& ex) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::DeriveKey(
                "HKDF derivation exception: " + std::string(ex.what())));
    }
}

Result<Unit, TransferFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("HKDF output size must be in [1, {}], got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }

    if (ikm.empty()) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    return RunKdf(EVP_KDF_HKDF_MODE_EXTRACT_AND_EXPAND, ikm, output, salt, info);
}

Result<std::vector<uint8_t>, TransferFailure> Hkdf::Extract(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt) {

    if (ikm.empty()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidInput("HKDF input key material cannot be empty"));
    }

    std::vector<uint8_t> prk(HASH_LEN);
    auto result = RunKdf(EVP_KDF_HKDF_MODE_EXTRACT_ONLY, ikm, prk, salt, {});
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            std::move(result).UnwrapErr());
    }

    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(prk));
}

Result<Unit, TransferFailure> Hkdf::Expand(
    std::span<const uint8_t> prk,
    std::span<uint8_t> output,
    std::span<const uint8_t> info) {

    if (prk.size() != HASH_LEN) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("PRK must be exactly {} bytes", HASH_LEN)));
    }

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("HKDF output size must be in [1, {}], got {}",
                    MAX_OUTPUT_LEN, output.size())));
    }

    return RunKdf(EVP_KDF_HKDF_MODE_EXPAND_ONLY, prk, output, {}, info);
}

} // namespace peerlink::transfer::crypto
