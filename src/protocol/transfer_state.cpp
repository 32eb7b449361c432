#include "peerlink/protocol/transfer_state.hpp"

namespace peerlink::transfer {

std::string_view ToString(const TransferState state) noexcept {
    switch (state) {
        case TransferState::Idle: return "Idle";
        case TransferState::ExchangingKeys: return "ExchangingKeys";
        case TransferState::Ready: return "Ready";
        case TransferState::Sending: return "Sending";
        case TransferState::Receiving: return "Receiving";
        case TransferState::Complete: return "Complete";
        case TransferState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string_view ToString(const TransferRole role) noexcept {
    switch (role) {
        case TransferRole::Sender: return "SENDER";
        case TransferRole::Receiver: return "RECEIVER";
    }
    return "UNKNOWN";
}

}
