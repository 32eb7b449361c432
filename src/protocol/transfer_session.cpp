#include "peerlink/protocol/transfer_session.hpp"
#include "peerlink/protocol/frame_cipher.hpp"
#include "peerlink/protocol/frame_codec.hpp"
#include "peerlink/protocol/key_derivation.hpp"
#include "peerlink/protocol/key_exchange_engine.hpp"
#include "peerlink/io/memory_streams.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include "peerlink/debug/trace_logger.hpp"
#include "peerlink/core/constants.hpp"
#include "peerlink/core/format.hpp"
#include <algorithm>
#include <chrono>
#include <string>

namespace peerlink::transfer::protocol {

    using configuration::TransferConfig;
    using crypto::SodiumInterop;
    using interfaces::IByteSink;
    using interfaces::IByteSource;
    using interfaces::ITransferEventHandler;
    using interfaces::ITransport;
    using interfaces::TransferProgress;

    class TransferSession::OperationScope {
    public:
        explicit OperationScope(TransferSession& session)
            : session_(session) {
        }

        ~OperationScope() {
            std::lock_guard lock(session_.mutex_);
            session_.busy_ = false;
            if (IsTerminal(session_.state_)) {
                session_.ReleaseResourcesLocked();
            }
        }

        OperationScope(const OperationScope&) = delete;
        OperationScope& operator=(const OperationScope&) = delete;

    private:
        TransferSession& session_;
    };

    // ========================================================================
    // Construction
    // ========================================================================

    Result<std::unique_ptr<TransferSession>, TransferFailure> TransferSession::Create(
        std::shared_ptr<ITransport> transport,
        const TransferRole role,
        TransferConfig config,
        std::shared_ptr<ITransferEventHandler> event_handler) {
        if (!transport) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::InvalidInput("Transport must not be null"));
        }
        if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                TransferFailure::FromSodiumFailure(init.UnwrapErr()));
        }

        config.max_payload_size = std::min(config.max_payload_size, transport->MaxPayloadSize());
        if (auto valid = config.Validate(); valid.IsErr()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                std::move(valid).UnwrapErr());
        }
        auto chunk_size = config.ChunkSize();
        if (chunk_size.IsErr()) {
            return Result<std::unique_ptr<TransferSession>, TransferFailure>::Err(
                std::move(chunk_size).UnwrapErr());
        }

        return Result<std::unique_ptr<TransferSession>, TransferFailure>::Ok(
            std::unique_ptr<TransferSession>(new TransferSession(
                std::move(transport), role, config, chunk_size.Unwrap(), std::move(event_handler))));
    }

    TransferSession::TransferSession(
        std::shared_ptr<ITransport> transport,
        const TransferRole role,
        TransferConfig config,
        const size_t chunk_size,
        std::shared_ptr<ITransferEventHandler> event_handler)
        : transport_(std::move(transport))
          , role_(role)
          , config_(config)
          , chunk_size_(chunk_size)
          , frame_budget_(FrameCodec::FrameBudget(config.max_payload_size, config.transport_encoding))
          , event_handler_(std::move(event_handler)) {
        transport_->OnNotify([this](std::span<const uint8_t> message) {
            HandleInbound(message);
        });
        transport_->OnDisconnect([this]() {
            Abort(TransferFailure::TransportError(std::string(ErrorMessages::SESSION_DISCONNECTED)));
        });
    }

    TransferSession::~TransferSession() {
        transport_->OnNotify(nullptr);
        transport_->OnDisconnect(nullptr);
        channel_.Close(std::string(ErrorMessages::SESSION_CANCELLED));
        std::lock_guard lock(mutex_);
        ReleaseResourcesLocked();
    }

    // ========================================================================
    // Public operations
    // ========================================================================

    Result<Unit, TransferFailure> TransferSession::Handshake() {
        if (auto begin = BeginOperation(TransferState::Idle, std::nullopt); begin.IsErr()) {
            return begin;
        }
        OperationScope scope(*this);
        return RunHandshake();
    }

    Result<Unit, TransferFailure> TransferSession::SendStream(IByteSource& source) {
        if (auto begin = BeginOperation(TransferState::Ready, TransferRole::Sender); begin.IsErr()) {
            return begin;
        }
        OperationScope scope(*this);
        if (!TransitionTo(TransferState::Sending)) {
            return Result<Unit, TransferFailure>::Err(TerminalFailure());
        }
        return SendFrames(source);
    }

    Result<Unit, TransferFailure> TransferSession::ReceiveStream(IByteSink& sink) {
        if (auto begin = BeginOperation(TransferState::Ready, TransferRole::Receiver); begin.IsErr()) {
            return begin;
        }
        OperationScope scope(*this);
        if (!TransitionTo(TransferState::Receiving)) {
            sink.Discard();
            return Result<Unit, TransferFailure>::Err(TerminalFailure());
        }

        auto received = ReceiveFrames(
            [&sink](uint32_t, std::span<const uint8_t> plaintext) {
                return sink.Write(plaintext);
            },
            [&sink]() {
                return sink.Commit();
            });
        if (received.IsErr()) {
            // No-op once committed; the output is complete at that point
            sink.Discard();
            return received;
        }

        if (!TransitionTo(TransferState::Complete)) {
            return Result<Unit, TransferFailure>::Err(TerminalFailure());
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferSession::Send(std::span<const uint8_t> data) {
        io::MemoryByteSource source(std::vector<uint8_t>(data.begin(), data.end()));
        return SendStream(source);
    }

    Result<std::vector<uint8_t>, TransferFailure> TransferSession::Receive() {
        if (auto begin = BeginOperation(TransferState::Ready, TransferRole::Receiver); begin.IsErr()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(std::move(begin).UnwrapErr());
        }
        OperationScope scope(*this);
        if (!TransitionTo(TransferState::Receiving)) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(TerminalFailure());
        }

        reassembler_.Clear();
        std::vector<uint8_t> output;
        auto received = ReceiveFrames(
            [this](uint32_t sequence_number, std::span<const uint8_t> plaintext) {
                reassembler_.Append(sequence_number, plaintext);
                return Result<Unit, TransferFailure>::Ok(unit);
            },
            [this, &output]() {
                reassembler_.MarkFinal();
                auto finalized = reassembler_.Finalize();
                if (finalized.IsErr()) {
                    return Result<Unit, TransferFailure>::Err(std::move(finalized).UnwrapErr());
                }
                output = std::move(finalized).Unwrap();
                return Result<Unit, TransferFailure>::Ok(unit);
            });
        if (received.IsErr()) {
            (void)SodiumInterop::SecureWipe(std::span(output));
            return Result<std::vector<uint8_t>, TransferFailure>::Err(std::move(received).UnwrapErr());
        }

        if (!TransitionTo(TransferState::Complete)) {
            (void)SodiumInterop::SecureWipe(std::span(output));
            return Result<std::vector<uint8_t>, TransferFailure>::Err(TerminalFailure());
        }
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(output));
    }

    void TransferSession::Cancel() {
        Abort(TransferFailure::TransportError(std::string(ErrorMessages::SESSION_CANCELLED)));
    }

    // ========================================================================
    // Queries
    // ========================================================================

    TransferState TransferSession::State() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    std::optional<TransferFailure> TransferSession::LastFailure() const {
        std::lock_guard lock(mutex_);
        return last_failure_;
    }

    TransferStatistics TransferSession::Statistics() const {
        std::lock_guard lock(mutex_);
        return statistics_;
    }

    std::vector<uint8_t> TransferSession::LocalPublicKey() const {
        std::lock_guard lock(mutex_);
        if (!key_pair_.has_value()) {
            return {};
        }
        return key_pair_->GetPublicKey();
    }

    bool TransferSession::HasKeyMaterial() const {
        std::lock_guard lock(mutex_);
        return (key_pair_.has_value() && !key_pair_->IsWiped()) ||
               (session_key_.has_value() && !session_key_->IsWiped());
    }

    // ========================================================================
    // Handshake
    // ========================================================================

    Result<Unit, TransferFailure> TransferSession::RunHandshake() {
        if (!TransitionTo(TransferState::ExchangingKeys)) {
            return Result<Unit, TransferFailure>::Err(TerminalFailure());
        }

        auto generated = KeyExchangeEngine::Generate();
        if (generated.IsErr()) {
            return Result<Unit, TransferFailure>::Err(Fail(std::move(generated).UnwrapErr()));
        }
        {
            std::lock_guard lock(mutex_);
            key_pair_.emplace(std::move(generated).Unwrap());
        }
        debug::LogPublicKey(role_, "local_public", key_pair_->GetPublicKey());

        auto exchanged = KeyExchangeEngine::ExchangePublicKeys(*transport_, *key_pair_, config_, cancelled_);
        if (exchanged.IsErr()) {
            return Result<Unit, TransferFailure>::Err(Fail(std::move(exchanged).UnwrapErr()));
        }
        const auto peer_public_key = std::move(exchanged).Unwrap();
        debug::LogPublicKey(role_, "peer_public", peer_public_key);

        auto shared_secret = KeyExchangeEngine::DeriveSharedSecret(*key_pair_, peer_public_key);
        if (shared_secret.IsErr()) {
            return Result<Unit, TransferFailure>::Err(Fail(std::move(shared_secret).UnwrapErr()));
        }

        auto session_key = KeyDerivation::Derive(shared_secret.Unwrap());
        if (session_key.IsErr()) {
            return Result<Unit, TransferFailure>::Err(Fail(std::move(session_key).UnwrapErr()));
        }
        {
            std::lock_guard lock(mutex_);
            session_key_.emplace(std::move(session_key).Unwrap());
            // The secret half has served its purpose
            key_pair_->Wipe();
        }

        if (!TransitionTo(TransferState::Ready)) {
            return Result<Unit, TransferFailure>::Err(TerminalFailure());
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    // ========================================================================
    // Sender
    // ========================================================================

    Result<Unit, TransferFailure> TransferSession::SendFrames(IByteSource& source) {
        const std::optional<uint64_t> total = source.TotalSize();
        std::vector<uint8_t> pending;
        bool end_of_stream = false;
        uint32_t sequence_number = 0;
        uint64_t bytes_acknowledged = 0;

        while (true) {
            while (!end_of_stream && pending.size() <= chunk_size_) {
                auto block = source.Read(config_.read_block_size);
                if (block.IsErr()) {
                    (void)SodiumInterop::SecureWipe(std::span(pending));
                    return Result<Unit, TransferFailure>::Err(Fail(std::move(block).UnwrapErr()));
                }
                auto bytes = std::move(block).Unwrap();
                if (bytes.empty()) {
                    end_of_stream = true;
                } else {
                    pending.insert(pending.end(), bytes.begin(), bytes.end());
                }
            }

            const size_t chunk_len = std::min(chunk_size_, pending.size());
            const bool is_last = end_of_stream && pending.size() <= chunk_size_;
            const std::span<const uint8_t> chunk(pending.data(), chunk_len);

            auto frame = FrameCipher::EncryptFrame(sequence_number, is_last, chunk, *session_key_);
            if (frame.IsErr()) {
                (void)SodiumInterop::SecureWipe(std::span(pending));
                return Result<Unit, TransferFailure>::Err(Fail(std::move(frame).UnwrapErr()));
            }
            auto serialized = FrameCodec::Serialize(frame.Unwrap(), frame_budget_);
            if (serialized.IsErr()) {
                (void)SodiumInterop::SecureWipe(std::span(pending));
                return Result<Unit, TransferFailure>::Err(Fail(std::move(serialized).UnwrapErr()));
            }
            const auto wire_bytes = FrameCodec::EncodeForTransport(serialized.Unwrap(), config_.transport_encoding);
            debug::LogFrameSent(role_, sequence_number, is_last, wire_bytes.size());

            if (auto sent = TransmitUntilAcknowledged(wire_bytes, sequence_number); sent.IsErr()) {
                (void)SodiumInterop::SecureWipe(std::span(pending));
                return sent;
            }

            bytes_acknowledged += chunk_len;
            (void)SodiumInterop::SecureWipe(std::span(pending.data(), chunk_len));
            pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(chunk_len));
            {
                std::lock_guard lock(mutex_);
                statistics_.payload_bytes += chunk_len;
            }
            ReportProgress(sequence_number + 1, bytes_acknowledged, total);

            if (is_last) {
                break;
            }
            if (sequence_number == kMaxSequenceNumber) {
                return Result<Unit, TransferFailure>::Err(Fail(
                    TransferFailure::Encode("Sequence number space exhausted")));
            }
            ++sequence_number;
        }

        if (!TransitionTo(TransferState::Complete)) {
            return Result<Unit, TransferFailure>::Err(TerminalFailure());
        }
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    Result<Unit, TransferFailure> TransferSession::TransmitUntilAcknowledged(
        std::span<const uint8_t> wire_bytes,
        const uint32_t sequence_number) {
        using Clock = std::chrono::steady_clock;

        for (uint32_t attempt = 0;; ++attempt) {
            if (attempt > 0) {
                if (attempt > config_.max_retransmissions) {
                    return Result<Unit, TransferFailure>::Err(Fail(
                        TransferFailure::FrameTimeout(
                            compat::format("Frame {} not acknowledged after {} retransmissions",
                                sequence_number, config_.max_retransmissions))));
                }
                CountStatistic(&TransferStatistics::retransmissions);
                debug::LogRetransmission(role_, sequence_number, attempt);
            }

            if (auto written = transport_->WriteWithoutAck(wire_bytes); written.IsErr()) {
                return Result<Unit, TransferFailure>::Err(Fail(
                    TransferFailure::TransportError(
                        "Frame write failed: " + written.UnwrapErr().message)));
            }
            CountStatistic(&TransferStatistics::frames_sent);

            const auto deadline = Clock::now() + config_.ack_timeout;
            while (true) {
                const auto now = Clock::now();
                if (now >= deadline) {
                    break;
                }
                auto message = channel_.Receive(
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                    std::chrono::milliseconds{1});
                if (message.IsErr()) {
                    if (message.UnwrapErr().type == TransferFailureType::FrameTimeout) {
                        break;
                    }
                    return Result<Unit, TransferFailure>::Err(Fail(std::move(message).UnwrapErr()));
                }

                auto decoded = FrameCodec::DecodeFromTransport(message.Unwrap(), config_.transport_encoding);
                if (decoded.IsErr()) {
                    continue;
                }
                auto ack = FrameCodec::ParseAck(decoded.Unwrap());
                if (ack.IsErr()) {
                    continue;
                }
                CountStatistic(&TransferStatistics::acks_received);
                debug::LogAck(role_, "ACK_RECV", ack.Unwrap().sequence_number);
                if (ack.Unwrap().sequence_number == sequence_number) {
                    return Result<Unit, TransferFailure>::Ok(unit);
                }
                // Stale acknowledgment of an earlier frame
            }
        }
    }

    // ========================================================================
    // Receiver
    // ========================================================================

    Result<Unit, TransferFailure> TransferSession::ReceiveFrames(
        const ChunkConsumer& consume,
        const CompletionStep& finish) {
        uint32_t expected = 0;
        uint64_t bytes_received = 0;

        while (true) {
            auto message = channel_.Receive(config_.receive_idle_timeout);
            if (message.IsErr()) {
                return Result<Unit, TransferFailure>::Err(Fail(std::move(message).UnwrapErr()));
            }

            auto decoded = FrameCodec::DecodeFromTransport(message.Unwrap(), config_.transport_encoding);
            if (decoded.IsErr()) {
                return Result<Unit, TransferFailure>::Err(Fail(std::move(decoded).UnwrapErr()));
            }
            auto parsed = FrameCodec::Parse(decoded.Unwrap());
            if (parsed.IsErr()) {
                return Result<Unit, TransferFailure>::Err(Fail(std::move(parsed).UnwrapErr()));
            }
            const Frame& frame = parsed.Unwrap();
            CountStatistic(&TransferStatistics::frames_received);

            if (frame.sequence_number < expected) {
                const auto duplicate = TransferFailure::OutOfOrderFrame(
                    compat::format("Duplicate frame {} (expected {})", frame.sequence_number, expected));
                debug::LogFrameDropped(role_, duplicate.message.c_str(), frame.sequence_number, expected);
                CountStatistic(&TransferStatistics::duplicate_frames);
                if (auto acked = SendAck(expected - 1); acked.IsErr()) {
                    return acked;
                }
                continue;
            }
            if (frame.sequence_number > expected) {
                debug::LogFrameDropped(role_, "future frame", frame.sequence_number, expected);
                CountStatistic(&TransferStatistics::dropped_frames);
                continue;
            }

            auto plaintext = FrameCipher::DecryptFrame(frame, *session_key_);
            if (plaintext.IsErr()) {
                return Result<Unit, TransferFailure>::Err(Fail(std::move(plaintext).UnwrapErr()));
            }
            auto chunk = std::move(plaintext).Unwrap();
            debug::LogFrameReceived(role_, frame.sequence_number, frame.is_last, chunk.size());

            auto consumed = consume(frame.sequence_number, chunk);
            const size_t chunk_len = chunk.size();
            (void)SodiumInterop::SecureWipe(std::span(chunk));
            if (consumed.IsErr()) {
                return Result<Unit, TransferFailure>::Err(Fail(std::move(consumed).UnwrapErr()));
            }

            if (frame.is_last) {
                if (auto finished = finish(); finished.IsErr()) {
                    return Result<Unit, TransferFailure>::Err(Fail(std::move(finished).UnwrapErr()));
                }
                std::lock_guard lock(mutex_);
                final_sequence_ = frame.sequence_number;
            }

            if (auto acked = SendAck(frame.sequence_number); acked.IsErr()) {
                return acked;
            }

            bytes_received += chunk_len;
            {
                std::lock_guard lock(mutex_);
                statistics_.payload_bytes += chunk_len;
            }
            ReportProgress(frame.sequence_number + 1, bytes_received, std::nullopt);

            if (frame.is_last) {
                // Retransmissions queued before final_sequence_ was set
                while (true) {
                    auto late = channel_.Receive(std::chrono::milliseconds{0});
                    if (late.IsErr()) {
                        break;
                    }
                    ReacknowledgeFinalFrame(late.Unwrap(), frame.sequence_number);
                }
                return Result<Unit, TransferFailure>::Ok(unit);
            }
            ++expected;
        }
    }

    Result<Unit, TransferFailure> TransferSession::SendAck(const uint32_t sequence_number) {
        const auto ack = FrameCodec::SerializeAck(Acknowledgment{sequence_number});
        const auto wire_bytes = FrameCodec::EncodeForTransport(ack, config_.transport_encoding);
        if (auto written = transport_->WriteWithoutAck(wire_bytes); written.IsErr()) {
            return Result<Unit, TransferFailure>::Err(Fail(
                TransferFailure::TransportError(
                    "Acknowledgment write failed: " + written.UnwrapErr().message)));
        }
        CountStatistic(&TransferStatistics::acks_sent);
        debug::LogAck(role_, "ACK_SEND", sequence_number);
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    void TransferSession::HandleInbound(std::span<const uint8_t> message) {
        std::optional<uint32_t> final_sequence;
        {
            std::lock_guard lock(mutex_);
            if (state_ != TransferState::Failed) {
                final_sequence = final_sequence_;
            }
        }
        if (!final_sequence.has_value()) {
            channel_.Push(message);
            return;
        }
        ReacknowledgeFinalFrame(message, *final_sequence);
    }

    void TransferSession::ReacknowledgeFinalFrame(
        std::span<const uint8_t> message,
        const uint32_t final_sequence) {
        auto decoded = FrameCodec::DecodeFromTransport(message, config_.transport_encoding);
        if (decoded.IsErr()) {
            debug::LogFailure(role_, ToString(decoded.UnwrapErr().type), decoded.UnwrapErr().message);
            return;
        }
        auto parsed = FrameCodec::Parse(decoded.Unwrap());
        if (parsed.IsErr()) {
            debug::LogFailure(role_, ToString(parsed.UnwrapErr().type), parsed.UnwrapErr().message);
            return;
        }
        const uint32_t sequence_number = parsed.Unwrap().sequence_number;
        if (sequence_number > final_sequence) {
            debug::LogFrameDropped(role_, "frame after completion", sequence_number, final_sequence);
            return;
        }

        CountStatistic(&TransferStatistics::duplicate_frames);
        const auto ack = FrameCodec::SerializeAck(Acknowledgment{final_sequence});
        const auto wire_bytes = FrameCodec::EncodeForTransport(ack, config_.transport_encoding);
        if (auto written = transport_->WriteWithoutAck(wire_bytes); written.IsErr()) {
            // The output is already complete; the sender learns about the link itself
            debug::LogFailure(role_, ToString(written.UnwrapErr().type), written.UnwrapErr().message);
            return;
        }
        CountStatistic(&TransferStatistics::acks_sent);
        debug::LogAck(role_, "ACK_RESEND", final_sequence);
    }

    // ========================================================================
    // State bookkeeping
    // ========================================================================

    Result<Unit, TransferFailure> TransferSession::BeginOperation(
        const TransferState required,
        const std::optional<TransferRole> required_role) {
        std::lock_guard lock(mutex_);
        if (busy_) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState("Another operation is already running on this session"));
        }
        if (required_role.has_value() && *required_role != role_) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    compat::format("Operation requires role {}, session is {}",
                        ToString(*required_role), ToString(role_))));
        }
        if (state_ != required) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::InvalidState(
                    compat::format("Operation requires state {}, session is {}",
                        ToString(required), ToString(state_))));
        }
        busy_ = true;
        return Result<Unit, TransferFailure>::Ok(unit);
    }

    bool TransferSession::TransitionTo(const TransferState next) {
        TransferState previous;
        {
            std::lock_guard lock(mutex_);
            if (IsTerminal(state_)) {
                return false;
            }
            previous = state_;
            state_ = next;
        }
        debug::LogStateChange(role_, previous, next);
        if (event_handler_) {
            event_handler_->OnStateChanged(previous, next);
        }
        return true;
    }

    TransferFailure TransferSession::TerminalFailure() const {
        std::lock_guard lock(mutex_);
        if (last_failure_.has_value()) {
            return *last_failure_;
        }
        return TransferFailure::InvalidState(
            compat::format("Session is already {}", ToString(state_)));
    }

    TransferFailure TransferSession::Fail(TransferFailure failure) {
        TransferState previous;
        {
            std::lock_guard lock(mutex_);
            if (state_ == TransferState::Failed && last_failure_.has_value()) {
                // A cancel or disconnect got here first; report that instead
                return *last_failure_;
            }
            if (state_ == TransferState::Complete) {
                return failure;
            }
            previous = state_;
            state_ = TransferState::Failed;
            last_failure_ = failure;
        }
        debug::LogFailure(role_, ToString(failure.type), failure.message);
        debug::LogStateChange(role_, previous, TransferState::Failed);
        if (event_handler_) {
            event_handler_->OnStateChanged(previous, TransferState::Failed);
        }
        return failure;
    }

    void TransferSession::Abort(TransferFailure failure) {
        cancelled_.store(true, std::memory_order_release);
        channel_.Close(failure.message);
        (void)Fail(std::move(failure));
        std::lock_guard lock(mutex_);
        if (!busy_) {
            ReleaseResourcesLocked();
        }
    }

    void TransferSession::ReleaseResourcesLocked() noexcept {
        key_pair_.reset();
        session_key_.reset();
        reassembler_.Clear();
    }

    void TransferSession::CountStatistic(uint32_t TransferStatistics::* counter) {
        std::lock_guard lock(mutex_);
        ++(statistics_.*counter);
    }

    void TransferSession::ReportProgress(
        const uint32_t frames,
        const uint64_t bytes,
        const std::optional<uint64_t> total) {
        if (!event_handler_) {
            return;
        }
        TransferProgress progress;
        progress.role = role_;
        progress.frames = frames;
        progress.bytes = bytes;
        progress.total_bytes = total;
        event_handler_->OnProgress(progress);
    }

}
