#include "peerlink/protocol/nonce.hpp"
#include <algorithm>

namespace peerlink::transfer::protocol {

    namespace {
        static_assert(kNoncePrefixBytes + kNonceSequenceBytes == kAesGcmNonceBytes,
                      "Nonce layout must match AES-GCM nonce size");
    }

    FrameNonceBytes FrameNonce::ForSequence(const uint32_t sequence_number) noexcept {
        FrameNonceBytes nonce{};
        std::copy(kNoncePrefix.begin(), kNoncePrefix.end(), nonce.begin());
        StoreBigEndian32(sequence_number,
                         std::span<uint8_t, 4>(nonce.data() + kNoncePrefixBytes, kNonceSequenceBytes));
        return nonce;
    }

    bool FrameNonce::Matches(std::span<const uint8_t> nonce, const uint32_t sequence_number) noexcept {
        if (nonce.size() != kAesGcmNonceBytes) {
            return false;
        }
        const auto expected = ForSequence(sequence_number);
        return std::equal(expected.begin(), expected.end(), nonce.begin());
    }

}
