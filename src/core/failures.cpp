#include "peerlink/core/failures.hpp"

namespace peerlink::transfer {

std::string_view ToString(const TransferFailureType type) noexcept {
    switch (type) {
        case TransferFailureType::Generic: return "Generic";
        case TransferFailureType::KeyGeneration: return "KeyGeneration";
        case TransferFailureType::DeriveKey: return "DeriveKey";
        case TransferFailureType::InvalidInput: return "InvalidInput";
        case TransferFailureType::InvalidState: return "InvalidState";
        case TransferFailureType::Encode: return "Encode";
        case TransferFailureType::Decode: return "Decode";
        case TransferFailureType::InvalidPeerKey: return "InvalidPeerKey";
        case TransferFailureType::HandshakeTimeout: return "HandshakeTimeout";
        case TransferFailureType::AuthenticationFailure: return "AuthenticationFailure";
        case TransferFailureType::OutOfOrderFrame: return "OutOfOrderFrame";
        case TransferFailureType::FrameTimeout: return "FrameTimeout";
        case TransferFailureType::IncompleteTransfer: return "IncompleteTransfer";
        case TransferFailureType::TransportError: return "TransportError";
    }
    return "Unknown";
}

}
