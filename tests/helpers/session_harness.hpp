#pragma once
#include "peerlink/protocol/transfer_session.hpp"
#include "peerlink/protocol/frame_codec.hpp"
#include "peerlink/transport/loopback_link.hpp"
#include <catch2/catch_test_macros.hpp>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace peerlink::transfer::test_helpers {

using protocol::TransferSession;
using transport::LinkSide;
using transport::LoopbackLink;

/// Records every callback so tests can assert on the sequence
class RecordingEventHandler final : public interfaces::ITransferEventHandler {
public:
    void OnStateChanged(TransferState from, TransferState to) override {
        std::lock_guard lock(mutex_);
        transitions_.emplace_back(from, to);
    }

    void OnProgress(const interfaces::TransferProgress& progress) override {
        std::lock_guard lock(mutex_);
        progress_.push_back(progress);
    }

    [[nodiscard]] std::vector<std::pair<TransferState, TransferState>> Transitions() const {
        std::lock_guard lock(mutex_);
        return transitions_;
    }

    [[nodiscard]] std::vector<interfaces::TransferProgress> Progress() const {
        std::lock_guard lock(mutex_);
        return progress_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<TransferState, TransferState>> transitions_;
    std::vector<interfaces::TransferProgress> progress_;
};

struct TransferOutcome {
    std::optional<Result<Unit, TransferFailure>> sender;
    std::optional<Result<std::vector<uint8_t>, TransferFailure>> receiver;
};

/// A sender on side A and a receiver on side B of one loopback link
class SessionPair {
public:
    explicit SessionPair(
        configuration::TransferConfig config = configuration::TransferConfig::Aggressive(),
        size_t link_mtu = kReferenceMaxPayloadBytes)
        : link(LoopbackLink::Create(link_mtu))
        , sender_events(std::make_shared<RecordingEventHandler>())
        , receiver_events(std::make_shared<RecordingEventHandler>()) {
        auto s = TransferSession::Create(link->Endpoint(LinkSide::A), TransferRole::Sender, config, sender_events);
        auto r = TransferSession::Create(link->Endpoint(LinkSide::B), TransferRole::Receiver, config, receiver_events);
        REQUIRE(s.IsOk());
        REQUIRE(r.IsOk());
        sender = std::move(s).Unwrap();
        receiver = std::move(r).Unwrap();
    }

    /// Runs both handshakes concurrently
    void Handshake() {
        auto peer = std::async(std::launch::async, [this]() { return receiver->Handshake(); });
        auto local = sender->Handshake();
        auto remote = peer.get();
        REQUIRE(local.IsOk());
        REQUIRE(remote.IsOk());
    }

    /// Handshake, then Send() on side A and Receive() on side B
    TransferOutcome Transfer(const std::vector<uint8_t>& data) {
        Handshake();
        TransferOutcome outcome;
        auto received = std::async(std::launch::async, [this]() { return receiver->Receive(); });
        outcome.sender.emplace(sender->Send(data));
        outcome.receiver.emplace(received.get());
        return outcome;
    }

    /// Frames side A put on the transfer channel, parsed
    [[nodiscard]] std::vector<protocol::Frame> SentFrames() const {
        std::vector<protocol::Frame> frames;
        for (const auto& bytes : link->Sent(LinkSide::A)) {
            auto parsed = protocol::FrameCodec::Parse(bytes);
            REQUIRE(parsed.IsOk());
            frames.push_back(std::move(parsed).Unwrap());
        }
        return frames;
    }

    std::shared_ptr<LoopbackLink> link;
    std::shared_ptr<RecordingEventHandler> sender_events;
    std::shared_ptr<RecordingEventHandler> receiver_events;
    std::unique_ptr<TransferSession> sender;
    std::unique_ptr<TransferSession> receiver;
};

/// Config whose plaintext chunk is exactly @p chunk bytes on a binary channel
inline configuration::TransferConfig ConfigWithChunk(size_t chunk) {
    auto config = configuration::TransferConfig::Aggressive();
    config.max_payload_size = chunk + kFrameOverheadBytes;
    return config;
}

}  // namespace peerlink::transfer::test_helpers
