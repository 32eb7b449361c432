#pragma once
#include "peerlink/interfaces/i_transport.hpp"
#include "peerlink/protocol/constants.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace peerlink::transfer::transport {

enum class LinkSide : uint8_t {
    A = 0,
    B = 1
};

/**
 * @brief Two connected in-process transports with fault injection
 *
 * Endpoint(A) and Endpoint(B) behave like the two ends of a radio link:
 * a handshake write on one side becomes readable on the other, and a
 * transfer-channel write is delivered to the other side's notification
 * callback on the writing thread. Callbacks run without the link state lock,
 * so they may query the link or write to it. Replacing a callback waits for
 * any call of it still in progress.
 *
 * Faults are addressed by the index of a side's transfer-channel write
 * (0 for the first frame or acknowledgment that side sends).
 */
class LoopbackLink : public std::enable_shared_from_this<LoopbackLink> {
public:
    [[nodiscard]] static std::shared_ptr<LoopbackLink> Create(
        size_t max_payload_size = kReferenceMaxPayloadBytes);

    [[nodiscard]] std::shared_ptr<interfaces::ITransport> Endpoint(LinkSide side);

    /// The write is reported as successful but never delivered
    void DropOutbound(LinkSide side, size_t write_index);

    /// Flips the low bit of byte @p byte_offset before delivery
    void TamperOutbound(LinkSide side, size_t write_index, size_t byte_offset);

    /// Disconnects the link when @p side attempts transfer write number @p write_index
    void DisconnectAt(LinkSide side, size_t write_index);

    void Disconnect();

    [[nodiscard]] bool IsConnected() const;

    [[nodiscard]] size_t MaxPayloadSize() const noexcept { return max_payload_size_; }

    /// Every transfer-channel write @p side made, as written (dropped ones included)
    [[nodiscard]] std::vector<std::vector<uint8_t>> Sent(LinkSide side) const;

private:
    friend class LoopbackTransport;

    struct SideState {
        std::deque<std::vector<uint8_t>> handshake_inbox;
        interfaces::ITransport::NotifyCallback notify;
        interfaces::ITransport::DisconnectCallback on_disconnect;
        std::vector<std::vector<uint8_t>> sent;
        std::set<size_t> drops;
        std::map<size_t, size_t> tampers;
        std::set<size_t> disconnect_at;
    };

    explicit LoopbackLink(size_t max_payload_size);

    static size_t Index(const LinkSide side) noexcept {
        return static_cast<size_t>(side);
    }

    static LinkSide Peer(const LinkSide side) noexcept {
        return side == LinkSide::A ? LinkSide::B : LinkSide::A;
    }

    /// Returns true when this call is the one that broke the link
    bool MarkDisconnectedLocked();
    void DispatchDisconnect();

    Result<Unit, TransferFailure> WriteHandshake(LinkSide from, std::span<const uint8_t> bytes);
    Result<std::vector<uint8_t>, TransferFailure> ReadHandshake(LinkSide side);
    Result<Unit, TransferFailure> WriteTransfer(LinkSide from, std::span<const uint8_t> bytes);
    void SetNotify(LinkSide side, interfaces::ITransport::NotifyCallback callback);
    void SetDisconnect(LinkSide side, interfaces::ITransport::DisconnectCallback callback);

    const size_t max_payload_size_;
    mutable std::mutex mutex_;
    // Guards the notify/on_disconnect callbacks and is held while they run
    std::recursive_mutex dispatch_mutex_;
    bool connected_ = true;
    SideState sides_[2];
};

}  // namespace peerlink::transfer::transport
