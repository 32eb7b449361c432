#pragma once

/**
 * @file trace_logger.hpp
 * @brief Protocol trace logging for transfer sessions.
 *
 * Traces state transitions, frame sequence numbers, acknowledgments and
 * retransmissions to stderr. Public keys are shown as a 4-byte fingerprint.
 * Shared secrets, session keys and plaintext are never passed to these helpers.
 *
 * Enable via CMake: -DPEERLINK_DEBUG_TRACE=ON
 */

#include "peerlink/protocol/transfer_state.hpp"

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace peerlink::transfer::debug {

#ifdef PEERLINK_DEBUG_TRACE

inline std::string Fingerprint(std::span<const uint8_t> data) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    static constexpr size_t kFingerprintBytes = 4;
    std::string result;
    const size_t n = data.size() < kFingerprintBytes ? data.size() : kFingerprintBytes;
    result.reserve(n * 2 + 3);
    for (size_t i = 0; i < n; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    result += "...";
    return result;
}

// ============================================================================
// Core logging macros
// ============================================================================

#define PLK_TRACE_MSG(role, operation, message) \
    do { \
        fprintf(stderr, "[PLK-TRACE] %s %s %s\n", \
            std::string(::peerlink::transfer::ToString(role)).c_str(), \
            operation, \
            message); \
    } while(0)

#define PLK_TRACE_VALUE(role, operation, name, value) \
    do { \
        fprintf(stderr, "[PLK-TRACE] %s %s %s: %s\n", \
            std::string(::peerlink::transfer::ToString(role)).c_str(), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
    } while(0)

#define PLK_TRACE_FINGERPRINT(role, operation, name, data) \
    do { \
        fprintf(stderr, "[PLK-TRACE] %s %s %s: %s\n", \
            std::string(::peerlink::transfer::ToString(role)).c_str(), \
            operation, \
            name, \
            ::peerlink::transfer::debug::Fingerprint(data).c_str()); \
    } while(0)

// ============================================================================
// Session events
// ============================================================================

inline void LogStateChange(TransferRole role, TransferState from, TransferState to) {
    const std::string message =
        std::string(transfer::ToString(from)) + " -> " + std::string(transfer::ToString(to));
    PLK_TRACE_MSG(role, "STATE", message.c_str());
}

inline void LogPublicKey(TransferRole role, const char* name, std::span<const uint8_t> public_key) {
    PLK_TRACE_FINGERPRINT(role, "HANDSHAKE", name, public_key);
}

inline void LogFrameSent(TransferRole role, uint32_t sequence, bool is_last, size_t wire_bytes) {
    PLK_TRACE_VALUE(role, "SEND", "seq", sequence);
    PLK_TRACE_VALUE(role, "SEND", "wire_bytes", wire_bytes);
    if (is_last) {
        PLK_TRACE_MSG(role, "SEND", "is_last");
    }
}

inline void LogRetransmission(TransferRole role, uint32_t sequence, uint32_t attempt) {
    PLK_TRACE_VALUE(role, "RETRANSMIT", "seq", sequence);
    PLK_TRACE_VALUE(role, "RETRANSMIT", "attempt", attempt);
}

inline void LogAck(TransferRole role, const char* operation, uint32_t sequence) {
    PLK_TRACE_VALUE(role, operation, "ack_seq", sequence);
}

inline void LogFrameReceived(TransferRole role, uint32_t sequence, bool is_last, size_t plaintext_bytes) {
    PLK_TRACE_VALUE(role, "RECV", "seq", sequence);
    PLK_TRACE_VALUE(role, "RECV", "plaintext_bytes", plaintext_bytes);
    if (is_last) {
        PLK_TRACE_MSG(role, "RECV", "is_last");
    }
}

inline void LogFrameDropped(TransferRole role, const char* reason, uint32_t sequence, uint32_t expected) {
    PLK_TRACE_MSG(role, "DROP", reason);
    PLK_TRACE_VALUE(role, "DROP", "seq", sequence);
    PLK_TRACE_VALUE(role, "DROP", "expected", expected);
}

inline void LogFailure(TransferRole role, std::string_view type, const std::string& message) {
    const std::string line = std::string(type) + ": " + message;
    PLK_TRACE_MSG(role, "FAILED", line.c_str());
}

#else // !PEERLINK_DEBUG_TRACE

#define PLK_TRACE_MSG(role, operation, message) ((void)0)
#define PLK_TRACE_VALUE(role, operation, name, value) ((void)0)
#define PLK_TRACE_FINGERPRINT(role, operation, name, data) ((void)0)

inline void LogStateChange(TransferRole, TransferState, TransferState) {}
inline void LogPublicKey(TransferRole, const char*, std::span<const uint8_t>) {}
inline void LogFrameSent(TransferRole, uint32_t, bool, size_t) {}
inline void LogRetransmission(TransferRole, uint32_t, uint32_t) {}
inline void LogAck(TransferRole, const char*, uint32_t) {}
inline void LogFrameReceived(TransferRole, uint32_t, bool, size_t) {}
inline void LogFrameDropped(TransferRole, const char*, uint32_t, uint32_t) {}
inline void LogFailure(TransferRole, std::string_view, const std::string&) {}

#endif // PEERLINK_DEBUG_TRACE

} // namespace peerlink::transfer::debug
