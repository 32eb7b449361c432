#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace peerlink::transfer::security {

/**
 * @brief Validation of peer X25519 public keys received during the handshake
 *
 * Rejects keys of the wrong size, the known small-order points (which would
 * force a predictable shared secret) and encodings that are not canonical
 * field elements (>= 2^255 - 19 once the unused top bit is cleared).
 * Every rejection is reported as InvalidPeerKey.
 */
class DhValidator {
public:
    static Result<Unit, TransferFailure> ValidateX25519PublicKey(
        std::span<const uint8_t> public_key);

    static constexpr size_t KEY_SIZE = 32;

private:
    static bool HasSmallOrder(std::span<const uint8_t> public_key);
    static bool IsValidCurve25519Point(std::span<const uint8_t> public_key);

    // Top bit is ignored by X25519, so comparisons mask it out of the last byte
    static constexpr uint8_t TOP_BYTE_MASK = 0x7F;
    static constexpr size_t WORD_SIZE = 4;
    static constexpr size_t FIELD_256_WORD_COUNT = KEY_SIZE / WORD_SIZE;

    // 2^255 - 19, little-endian
    static constexpr std::array<uint8_t, KEY_SIZE> CURVE_25519_PRIME = {
        0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
        0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f
    };

    static constexpr std::array<std::array<uint8_t, KEY_SIZE>, 7> SMALL_ORDER_POINTS = {{
        // 0 (order 4)
        {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        // 1 (order 1)
        {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
         0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
        // order 8
        {0xe0, 0xeb, 0x7a, 0x7c, 0x3b, 0x41, 0xb8, 0xae,
         0x16, 0x56, 0xe3, 0xfa, 0xf1, 0x9f, 0xc4, 0x6a,
         0xda, 0x09, 0x8d, 0xeb, 0x9c, 0x32, 0xb1, 0xfd,
         0x86, 0x62, 0x05, 0x16, 0x5f, 0x49, 0xb8, 0x00},
        // order 8
        {0x5f, 0x9c, 0x95, 0xbc, 0xa3, 0x50, 0x8c, 0x24,
         0xb1, 0xd0, 0xb1, 0x55, 0x9c, 0x83, 0xef, 0x5b,
         0x04, 0x44, 0x5c, 0xc4, 0x58, 0x1c, 0x8e, 0x86,
         0xd8, 0x22, 0x4e, 0xdd, 0xd0, 0x9f, 0x11, 0x57},
        // p - 1 (order 2)
        {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
        // p (= 0)
        {0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
        // p + 1 (= 1)
        {0xee, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
         0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    }};

    DhValidator() = delete;
};

} // namespace peerlink::transfer::security
