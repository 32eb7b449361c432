#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include "peerlink/configuration/transfer_config.hpp"
#include "peerlink/interfaces/i_byte_sink.hpp"
#include "peerlink/interfaces/i_byte_source.hpp"
#include "peerlink/interfaces/i_transfer_event_handler.hpp"
#include "peerlink/interfaces/i_transport.hpp"
#include "peerlink/models/keys/ephemeral_key_pair.hpp"
#include "peerlink/models/keys/session_key.hpp"
#include "peerlink/protocol/inbound_channel.hpp"
#include "peerlink/protocol/reassembler.hpp"
#include "peerlink/protocol/transfer_state.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace peerlink::transfer::protocol {

/**
 * @brief One file transfer over one connection
 *
 * State machine:
 * ```
 * Idle -> ExchangingKeys -> Ready -> Sending   -> Complete
 *                                 -> Receiving -> Complete
 * any non-terminal state -> Failed
 * ```
 *
 * Handshake() runs the ephemeral X25519 exchange and derives the session
 * key. The Sender then streams frames with stop-and-wait flow control: one
 * frame outstanding, retransmitted unchanged on ack timeout up to
 * config.max_retransmissions times. The Receiver accepts frames strictly in
 * sequence order, re-acknowledges duplicates and ignores frames from the
 * future. The final frame is acknowledged only after the output is complete,
 * and a completed Receiver keeps answering retransmissions of it for as long
 * as the transport delivers them.
 *
 * Key material lives in secure memory and is released as soon as the
 * session reaches Complete or Failed. Cancel() and a transport disconnect
 * may come from any thread; they wake whatever the session is waiting on.
 */
class TransferSession {
public:
    [[nodiscard]] static Result<std::unique_ptr<TransferSession>, TransferFailure> Create(
        std::shared_ptr<interfaces::ITransport> transport,
        TransferRole role,
        configuration::TransferConfig config = configuration::TransferConfig::Default(),
        std::shared_ptr<interfaces::ITransferEventHandler> event_handler = nullptr);

    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;
    TransferSession(TransferSession&&) = delete;
    TransferSession& operator=(TransferSession&&) = delete;

    /// Idle -> ExchangingKeys -> Ready
    [[nodiscard]] Result<Unit, TransferFailure> Handshake();

    /// Sender only; Ready -> Sending -> Complete
    [[nodiscard]] Result<Unit, TransferFailure> SendStream(interfaces::IByteSource& source);

    /// Receiver only; Ready -> Receiving -> Complete. The sink is committed on
    /// success and discarded on any failure.
    [[nodiscard]] Result<Unit, TransferFailure> ReceiveStream(interfaces::IByteSink& sink);

    [[nodiscard]] Result<Unit, TransferFailure> Send(std::span<const uint8_t> data);

    /// Receives into the in-memory reassembly buffer
    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Receive();

    /// Fails the session with TransportError and wipes its keys
    void Cancel();

    [[nodiscard]] TransferState State() const;
    [[nodiscard]] TransferRole Role() const noexcept { return role_; }
    [[nodiscard]] std::optional<TransferFailure> LastFailure() const;
    [[nodiscard]] TransferStatistics Statistics() const;

    /// Empty once the key pair has been released
    [[nodiscard]] std::vector<uint8_t> LocalPublicKey() const;
    [[nodiscard]] bool HasKeyMaterial() const;

private:
    using ChunkConsumer = std::function<Result<Unit, TransferFailure>(uint32_t, std::span<const uint8_t>)>;
    /// Runs once the final chunk is consumed, before it is acknowledged
    using CompletionStep = std::function<Result<Unit, TransferFailure>()>;

    TransferSession(
        std::shared_ptr<interfaces::ITransport> transport,
        TransferRole role,
        configuration::TransferConfig config,
        size_t chunk_size,
        std::shared_ptr<interfaces::ITransferEventHandler> event_handler);

    class OperationScope;

    [[nodiscard]] Result<Unit, TransferFailure> BeginOperation(
        TransferState required,
        std::optional<TransferRole> required_role);
    [[nodiscard]] Result<Unit, TransferFailure> RunHandshake();
    [[nodiscard]] Result<Unit, TransferFailure> SendFrames(interfaces::IByteSource& source);
    [[nodiscard]] Result<Unit, TransferFailure> TransmitUntilAcknowledged(
        std::span<const uint8_t> wire_bytes,
        uint32_t sequence_number);
    [[nodiscard]] Result<Unit, TransferFailure> ReceiveFrames(
        const ChunkConsumer& consume,
        const CompletionStep& finish);
    [[nodiscard]] Result<Unit, TransferFailure> SendAck(uint32_t sequence_number);
    void HandleInbound(std::span<const uint8_t> message);
    void ReacknowledgeFinalFrame(std::span<const uint8_t> message, uint32_t final_sequence);

    bool TransitionTo(TransferState next);
    [[nodiscard]] TransferFailure TerminalFailure() const;
    TransferFailure Fail(TransferFailure failure);
    void Abort(TransferFailure failure);
    void ReleaseResourcesLocked() noexcept;
    void CountStatistic(uint32_t TransferStatistics::* counter);
    void ReportProgress(uint32_t frames, uint64_t bytes, std::optional<uint64_t> total);

    std::shared_ptr<interfaces::ITransport> transport_;
    const TransferRole role_;
    const configuration::TransferConfig config_;
    const size_t chunk_size_;
    const size_t frame_budget_;
    std::shared_ptr<interfaces::ITransferEventHandler> event_handler_;

    InboundChannel channel_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    TransferState state_ = TransferState::Idle;
    std::optional<TransferFailure> last_failure_;
    TransferStatistics statistics_{};
    bool busy_ = false;
    /// Set by the Receiver once the final frame is accepted
    std::optional<uint32_t> final_sequence_;
    std::optional<models::EphemeralKeyPair> key_pair_;
    std::optional<models::SessionKey> session_key_;
    Reassembler reassembler_;
};

}  // namespace peerlink::transfer::protocol
