#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>

namespace peerlink::transfer::crypto {

/**
 * @brief HKDF (HMAC-based Key Derivation Function) wrapper
 *
 * Implements RFC 5869 HKDF using SHA-256 on top of OpenSSL EVP_KDF.
 *
 * HKDF has two phases:
 * 1. Extract: Creates a pseudo-random key (PRK) from input key material
 * 2. Expand: Expands PRK into output keying material
 *
 * DeriveKey() runs both phases in one call.
 */
class Hkdf {
public:
    /**
     * @brief Derive key using HKDF-SHA256 (extract then expand)
     *
     * @param ikm Input key material (shared secret)
     * @param output Output buffer to fill with derived key
     * @param salt Optional salt (empty means HashLen zero bytes)
     * @param info Optional context/application-specific info
     */
    static Result<Unit, TransferFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /**
     * @brief HKDF Extract phase
     *
     * @return Ok(prk) where prk is HASH_LEN bytes
     */
    static Result<std::vector<uint8_t>, TransferFailure> Extract(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt = {});

    /**
     * @brief HKDF Expand phase
     *
     * @param prk Pseudorandom key from Extract (must be HASH_LEN bytes)
     */
    static Result<Unit, TransferFailure> Expand(
        std::span<const uint8_t> prk,
        std::span<uint8_t> output,
        std::span<const uint8_t> info = {});

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    static Result<Unit, TransferFailure> RunKdf(
        int mode,
        std::span<const uint8_t> key,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info);

    Hkdf() = delete;
};

} // namespace peerlink::transfer::crypto
