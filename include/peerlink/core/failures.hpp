#pragma once
#include <string>
#include <string_view>
namespace peerlink::transfer {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    EncodingFailed,
    InvalidOperation
};
enum class TransferFailureType {
    Generic,
    KeyGeneration,
    DeriveKey,
    InvalidInput,
    InvalidState,
    Encode,
    Decode,
    InvalidPeerKey,
    HandshakeTimeout,
    AuthenticationFailure,
    OutOfOrderFrame,
    FrameTimeout,
    IncompleteTransfer,
    TransportError
};
[[nodiscard]] std::string_view ToString(TransferFailureType type) noexcept;
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure EncodingFailed(std::string msg) {
        return {SodiumFailureType::EncodingFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Failure raised by the transfer protocol.
///
/// Handshake-layer failures (InvalidPeerKey, HandshakeTimeout), AuthenticationFailure,
/// TransportError and an exhausted FrameTimeout are fatal to the session.
/// OutOfOrderFrame is recoverable: the receiver re-acknowledges and continues.
class TransferFailure {
public:
    TransferFailureType type;
    std::string message;
    TransferFailure(const TransferFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static TransferFailure Generic(std::string msg) {
        return {TransferFailureType::Generic, std::move(msg)};
    }
    static TransferFailure KeyGeneration(std::string msg) {
        return {TransferFailureType::KeyGeneration, std::move(msg)};
    }
    static TransferFailure DeriveKey(std::string msg) {
        return {TransferFailureType::DeriveKey, std::move(msg)};
    }
    static TransferFailure InvalidInput(std::string msg) {
        return {TransferFailureType::InvalidInput, std::move(msg)};
    }
    static TransferFailure InvalidState(std::string msg) {
        return {TransferFailureType::InvalidState, std::move(msg)};
    }
    static TransferFailure Encode(std::string msg) {
        return {TransferFailureType::Encode, std::move(msg)};
    }
    static TransferFailure Decode(std::string msg) {
        return {TransferFailureType::Decode, std::move(msg)};
    }
    static TransferFailure InvalidPeerKey(std::string msg) {
        return {TransferFailureType::InvalidPeerKey, std::move(msg)};
    }
    static TransferFailure HandshakeTimeout(std::string msg) {
        return {TransferFailureType::HandshakeTimeout, std::move(msg)};
    }
    static TransferFailure AuthenticationFailure(std::string msg) {
        return {TransferFailureType::AuthenticationFailure, std::move(msg)};
    }
    static TransferFailure OutOfOrderFrame(std::string msg) {
        return {TransferFailureType::OutOfOrderFrame, std::move(msg)};
    }
    static TransferFailure FrameTimeout(std::string msg) {
        return {TransferFailureType::FrameTimeout, std::move(msg)};
    }
    static TransferFailure IncompleteTransfer(std::string msg) {
        return {TransferFailureType::IncompleteTransfer, std::move(msg)};
    }
    static TransferFailure TransportError(std::string msg) {
        return {TransferFailureType::TransportError, std::move(msg)};
    }
    static TransferFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Generic(sf.message);
    }
    [[nodiscard]] bool IsRecoverable() const noexcept {
        return type == TransferFailureType::OutOfOrderFrame;
    }
};
}
