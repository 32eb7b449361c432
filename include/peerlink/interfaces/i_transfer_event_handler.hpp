#pragma once
#include "peerlink/protocol/transfer_state.hpp"
#include <cstdint>
#include <optional>
namespace peerlink::transfer::interfaces {

struct TransferProgress {
    TransferRole role = TransferRole::Sender;
    uint32_t frames = 0;
    uint64_t bytes = 0;
    std::optional<uint64_t> total_bytes;

    /// 0..100 when the total is known; an empty stream counts as 100
    [[nodiscard]] std::optional<double> Percent() const noexcept {
        if (!total_bytes.has_value()) {
            return std::nullopt;
        }
        if (*total_bytes == 0) {
            return 100.0;
        }
        return static_cast<double>(bytes) * 100.0 / static_cast<double>(*total_bytes);
    }
};

/**
 * @brief Optional observer of a TransferSession
 *
 * Called on the thread driving the session, except that OnStateChanged for
 * a Cancel() or disconnect arrives on the cancelling thread. Handlers must
 * not call back into the session.
 */
class ITransferEventHandler {
public:
    virtual ~ITransferEventHandler() = default;
    virtual void OnStateChanged(TransferState from, TransferState to) = 0;
    /// Sender: after each acknowledged frame. Receiver: after each accepted frame.
    virtual void OnProgress(const TransferProgress& progress) = 0;
};
}
