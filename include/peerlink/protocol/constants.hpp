#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace peerlink::transfer {

inline constexpr uint32_t kProtocolVersion = 1;

inline constexpr size_t kX25519PublicKeyBytes = 32;
inline constexpr size_t kX25519PrivateKeyBytes = 32;
inline constexpr size_t kX25519SharedSecretBytes = 32;

inline constexpr size_t kSessionKeyBytes = 32;
inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

// Wire frame: [sequence:4 BE][flags:1][nonce:12][ciphertext][tag:16]
inline constexpr size_t kSequenceNumberBytes = 4;
inline constexpr size_t kFlagsBytes = 1;
inline constexpr size_t kFrameHeaderBytes = kSequenceNumberBytes + kFlagsBytes;
inline constexpr size_t kFrameOverheadBytes = kFrameHeaderBytes + kAesGcmNonceBytes + kAesGcmTagBytes;
inline constexpr size_t kAckBytes = kSequenceNumberBytes;

inline constexpr uint8_t kFlagIsLast = 0x01;
inline constexpr uint8_t kReservedFlagsMask = static_cast<uint8_t>(~kFlagIsLast);

// Nonce: [prefix:8][sequence:4 BE]
inline constexpr size_t kNoncePrefixBytes = 8;
inline constexpr size_t kNonceSequenceBytes = 4;
inline constexpr std::array<uint8_t, kNoncePrefixBytes> kNoncePrefix = {
    'P', 'L', 'K', 'F', 'R', 'A', 'M', 'E'
};
inline constexpr uint64_t kMaxSequenceNumber = 0xFFFFFFFFull;

inline constexpr std::string_view kSessionKeyInfo = "PeerLink-Transfer-v1";
inline constexpr std::string_view kSessionKeySalt = "PeerLink-Transfer-Salt-v1";

inline constexpr size_t kReferenceMaxPayloadBytes = 180;
inline constexpr size_t kMinimumMaxPayloadBytes = kFrameOverheadBytes + 1;
inline constexpr size_t kDefaultReadBlockBytes = 4096;

inline constexpr std::chrono::milliseconds kDefaultAckTimeout{2000};
inline constexpr std::chrono::milliseconds kDefaultHandshakeTimeout{10000};
inline constexpr std::chrono::milliseconds kDefaultHandshakePollInterval{100};
inline constexpr std::chrono::milliseconds kDefaultReceiveIdleTimeout{30000};
inline constexpr uint32_t kDefaultMaxRetransmissions = 5;

inline constexpr std::string_view kDefaultServiceId = "12345678-1234-5678-1234-56789abcdef0";
inline constexpr std::string_view kDefaultHandshakeChannelId = "12345678-1234-5678-1234-56789abcdef1";
inline constexpr std::string_view kDefaultTransferChannelId = "12345678-1234-5678-1234-56789abcdef2";

}  // namespace peerlink::transfer
