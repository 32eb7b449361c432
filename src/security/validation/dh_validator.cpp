#include "peerlink/security/validation/dh_validator.hpp"
#include "peerlink/core/format.hpp"

namespace peerlink::transfer::security {

Result<Unit, TransferFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != KEY_SIZE) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidPeerKey(
                compat::format(
                    "Invalid X25519 public key size: expected {}, got {}",
                    KEY_SIZE,
                    public_key.size())));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidPeerKey(
                "X25519 public key is a small-order point (invalid for DH)"));
    }

    if (!IsValidCurve25519Point(public_key)) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidPeerKey(
                "X25519 public key is not a canonical Curve25519 field element"));
    }

    return Result<Unit, TransferFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    // Accumulate over every candidate so timing does not reveal which one matched
    uint8_t any_match = 0;
    for (const auto& point : SMALL_ORDER_POINTS) {
        uint8_t diff = 0;
        for (size_t i = 0; i + 1 < KEY_SIZE; ++i) {
            diff |= public_key[i] ^ point[i];
        }
        diff |= (public_key[KEY_SIZE - 1] & TOP_BYTE_MASK) ^ point[KEY_SIZE - 1];
        any_match |= static_cast<uint8_t>(diff == 0);
    }
    return any_match != 0;
}

bool DhValidator::IsValidCurve25519Point(std::span<const uint8_t> public_key) {
    std::array<uint32_t, FIELD_256_WORD_COUNT> key_words{};
    std::array<uint32_t, FIELD_256_WORD_COUNT> prime_words{};

    for (size_t i = 0; i < FIELD_256_WORD_COUNT; ++i) {
        const size_t byte_offset = i * WORD_SIZE;
        key_words[i] = static_cast<uint32_t>(public_key[byte_offset]) |
                      (static_cast<uint32_t>(public_key[byte_offset + 1]) << 8) |
                      (static_cast<uint32_t>(public_key[byte_offset + 2]) << 16) |
                      (static_cast<uint32_t>(public_key[byte_offset + 3]) << 24);
        prime_words[i] = static_cast<uint32_t>(CURVE_25519_PRIME[byte_offset]) |
                        (static_cast<uint32_t>(CURVE_25519_PRIME[byte_offset + 1]) << 8) |
                        (static_cast<uint32_t>(CURVE_25519_PRIME[byte_offset + 2]) << 16) |
                        (static_cast<uint32_t>(CURVE_25519_PRIME[byte_offset + 3]) << 24);
    }
    key_words[FIELD_256_WORD_COUNT - 1] &= 0x7FFFFFFFu;

    // Most significant word first
    for (size_t i = FIELD_256_WORD_COUNT; i-- > 0;) {
        if (key_words[i] < prime_words[i]) {
            return true;
        }
        if (key_words[i] > prime_words[i]) {
            return false;
        }
    }

    // Equal to p
    return false;
}

} // namespace peerlink::transfer::security
