#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include "peerlink/protocol/constants.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace peerlink::transfer::configuration {

/// How bytes are represented on the radio channel
///
/// - Binary: frames, acknowledgments and handshake keys are written raw
/// - Base64: every payload is base64 text (for stacks that only carry strings)
enum class TransportEncoding : uint8_t {
    Binary = 0,
    Base64 = 1
};

/// Tunables for one TransferSession
///
/// Both peers must agree on transport_encoding. The timing fields only
/// affect the local side.
///
/// @example
/// ```cpp
/// auto config = TransferConfig::Default();
/// config.max_payload_size = transport.MaxPayloadSize();
/// if (auto check = config.Validate(); check.IsErr()) { ... }
/// ```
struct TransferConfig {
    size_t max_payload_size = kReferenceMaxPayloadBytes;
    TransportEncoding transport_encoding = TransportEncoding::Binary;

    /// Wait for the acknowledgment of one frame before retransmitting it
    std::chrono::milliseconds ack_timeout = kDefaultAckTimeout;
    /// Retransmissions of a single frame before the send fails with FrameTimeout
    uint32_t max_retransmissions = kDefaultMaxRetransmissions;

    std::chrono::milliseconds handshake_timeout = kDefaultHandshakeTimeout;
    std::chrono::milliseconds handshake_poll_interval = kDefaultHandshakePollInterval;

    /// Longest silence tolerated between two inbound frames
    std::chrono::milliseconds receive_idle_timeout = kDefaultReceiveIdleTimeout;

    /// Upper bound for one Read() from the IByteSource; chunks are further cut to ChunkSize()
    size_t read_block_size = kDefaultReadBlockBytes;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Reference radio profile: 180-byte payloads, binary channel
    [[nodiscard]] static constexpr TransferConfig Default() noexcept {
        return TransferConfig{};
    }

    /// Same as Default() but every payload is base64 text
    [[nodiscard]] static constexpr TransferConfig TextSafe() noexcept {
        TransferConfig config{};
        config.transport_encoding = TransportEncoding::Base64;
        return config;
    }

    /// Short timeouts for in-process links and tests
    [[nodiscard]] static constexpr TransferConfig Aggressive() noexcept {
        TransferConfig config{};
        config.ack_timeout = std::chrono::milliseconds{100};
        config.max_retransmissions = 3;
        config.handshake_timeout = std::chrono::milliseconds{1000};
        config.handshake_poll_interval = std::chrono::milliseconds{5};
        config.receive_idle_timeout = std::chrono::milliseconds{3000};
        return config;
    }

    /// Checks that every field is usable and that the payload budget can
    /// carry at least one plaintext byte per frame
    [[nodiscard]] Result<Unit, TransferFailure> Validate() const;

    /// Largest plaintext chunk that fits one frame under this configuration
    [[nodiscard]] Result<size_t, TransferFailure> ChunkSize() const;
};

}
