#include <catch2/catch_test_macros.hpp>
#include "helpers/session_harness.hpp"
#include "helpers/temp_directory.hpp"
#include "helpers/test_vectors.hpp"
#include "peerlink/io/file_streams.hpp"
#include <chrono>
#include <filesystem>
#include <future>
#include <mutex>
#include <span>
#include <thread>

using namespace peerlink::transfer;
using namespace peerlink::transfer::test_helpers;
using peerlink::transfer::configuration::TransferConfig;

namespace {
    /// Accepts every chunk, then refuses to commit
    struct RefusingSink final : interfaces::IByteSink {
        Result<Unit, TransferFailure> Write(std::span<const uint8_t> bytes) override {
            written += bytes.size();
            return Result<Unit, TransferFailure>::Ok(unit);
        }

        Result<Unit, TransferFailure> Commit() override {
            return Result<Unit, TransferFailure>::Err(TransferFailure::Generic("No space left on device"));
        }

        void Discard() noexcept override {
            discarded = true;
        }

        size_t written = 0;
        bool discarded = false;
    };

    /// Reads the link state from inside OnStateChanged
    class LinkStateHandler final : public interfaces::ITransferEventHandler {
    public:
        explicit LinkStateHandler(std::shared_ptr<LoopbackLink> link)
            : link_(std::move(link)) {
        }

        void OnStateChanged(TransferState, const TransferState to) override {
            if (to == TransferState::Failed) {
                const bool connected = link_->IsConnected();
                std::lock_guard lock(mutex_);
                connected_when_failed_.push_back(connected);
            }
        }

        void OnProgress(const interfaces::TransferProgress&) override {}

        [[nodiscard]] std::vector<bool> ConnectedWhenFailed() const {
            std::lock_guard lock(mutex_);
            return connected_when_failed_;
        }

    private:
        std::shared_ptr<LoopbackLink> link_;
        mutable std::mutex mutex_;
        std::vector<bool> connected_when_failed_;
    };

    std::unique_ptr<TransferSession> MakeSession(
        const std::shared_ptr<LoopbackLink>& link,
        const LinkSide side,
        const TransferRole role,
        const TransferConfig& config = TransferConfig::Aggressive()) {
        auto session = TransferSession::Create(link->Endpoint(side), role, config);
        REQUIRE(session.IsOk());
        return std::move(session).Unwrap();
    }
}

TEST_CASE("Transfer Failures - Disconnect mid-transfer", "[integration][failure][disconnect]") {
    SessionPair pair;
    const auto data = PatternBytes(1000, 8);
    pair.link->DisconnectAt(LinkSide::A, 2);

    auto outcome = pair.Transfer(data);
    REQUIRE(outcome.sender->IsErr());
    REQUIRE(outcome.sender->UnwrapErr().type == TransferFailureType::TransportError);
    REQUIRE(outcome.receiver->IsErr());
    REQUIRE(outcome.receiver->UnwrapErr().type == TransferFailureType::TransportError);

    REQUIRE(pair.sender->State() == TransferState::Failed);
    REQUIRE(pair.receiver->State() == TransferState::Failed);
    REQUIRE_FALSE(pair.sender->HasKeyMaterial());
    REQUIRE_FALSE(pair.receiver->HasKeyMaterial());
    REQUIRE_FALSE(pair.link->IsConnected());
}

TEST_CASE("Transfer Failures - Failed receive leaves no output file", "[integration][failure][io]") {
    TempDirectory directory;
    const auto output_path = directory.Path() / "received.bin";

    SessionPair pair;
    pair.Handshake();
    pair.link->DisconnectAt(LinkSide::A, 3);

    auto sink = io::AtomicFileSink::Create(output_path);
    REQUIRE(sink.IsOk());
    auto sink_ptr = std::move(sink).Unwrap();

    auto received = std::async(std::launch::async, [&]() {
        return pair.receiver->ReceiveStream(*sink_ptr);
    });
    REQUIRE(pair.sender->Send(PatternBytes(1000, 1)).IsErr());
    auto result = received.get();

    REQUIRE(result.IsErr());
    REQUIRE_FALSE(sink_ptr->IsCommitted());
    REQUIRE_FALSE(std::filesystem::exists(output_path));
    REQUIRE_FALSE(std::filesystem::exists(io::AtomicFileSink::PartialPathFor(output_path)));
}

TEST_CASE("Transfer Failures - Silent peer", "[integration][failure][handshake]") {
    auto link = LoopbackLink::Create();
    auto config = TransferConfig::Aggressive();
    config.handshake_timeout = std::chrono::milliseconds{200};
    auto receiver = MakeSession(link, LinkSide::B, TransferRole::Receiver, config);

    const auto started = std::chrono::steady_clock::now();
    auto result = receiver->Handshake();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == TransferFailureType::HandshakeTimeout);
    REQUIRE(elapsed >= std::chrono::milliseconds{200});
    REQUIRE(receiver->State() == TransferState::Failed);
    REQUIRE(receiver->LastFailure()->type == TransferFailureType::HandshakeTimeout);
    REQUIRE_FALSE(receiver->HasKeyMaterial());
}

TEST_CASE("Transfer Failures - Invalid peer public key", "[integration][failure][handshake]") {
    auto link = LoopbackLink::Create();
    auto raw_peer = link->Endpoint(LinkSide::A);
    auto receiver = MakeSession(link, LinkSide::B, TransferRole::Receiver);

    SECTION("All-zero key") {
        REQUIRE(raw_peer->Write(std::vector<uint8_t>(kX25519PublicKeyBytes, 0)).IsOk());
    }
    SECTION("Small-order point") {
        REQUIRE(raw_peer->Write(FromHex(
            "e0eb7a7c3b41b8ae1656e3faf19fc46ada098deb9c32b1fd866205165f49b800")).IsOk());
    }
    SECTION("Wrong length") {
        REQUIRE(raw_peer->Write(std::vector<uint8_t>(16, 0x42)).IsOk());
    }

    auto result = receiver->Handshake();
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidPeerKey);
    REQUIRE(receiver->State() == TransferState::Failed);
    REQUIRE_FALSE(receiver->HasKeyMaterial());
}

TEST_CASE("Transfer Failures - Sender gives up after retransmissions", "[integration][failure][retransmission]") {
    SessionPair pair;
    for (size_t i = 0; i < 8; ++i) {
        pair.link->DropOutbound(LinkSide::B, i);
    }
    pair.Handshake();

    auto received = std::async(std::launch::async, [&]() { return pair.receiver->Receive(); });
    auto sent = pair.sender->Send(PatternBytes(500, 6));
    pair.receiver->Cancel();
    auto receiver_result = received.get();

    REQUIRE(sent.IsErr());
    REQUIRE(sent.UnwrapErr().type == TransferFailureType::FrameTimeout);
    const auto stats = pair.sender->Statistics();
    REQUIRE(stats.retransmissions == 3);
    REQUIRE(stats.frames_sent == 4);
    REQUIRE(stats.acks_received == 0);

    REQUIRE(receiver_result.IsErr());
    REQUIRE(receiver_result.UnwrapErr().type == TransferFailureType::TransportError);
    REQUIRE(pair.receiver->Statistics().duplicate_frames == 3);
}

TEST_CASE("Transfer Failures - Final acknowledgment lost on every attempt", "[integration][failure][retransmission]") {
    SessionPair pair;
    for (size_t i = 0; i < 8; ++i) {
        pair.link->DropOutbound(LinkSide::B, i);
    }

    auto outcome = pair.Transfer(PatternBytes(40, 6));

    REQUIRE(outcome.receiver->IsOk());
    REQUIRE(pair.receiver->State() == TransferState::Complete);
    REQUIRE(outcome.sender->IsErr());
    REQUIRE(outcome.sender->UnwrapErr().type == TransferFailureType::FrameTimeout);

    // Every retransmission was answered; the link lost all the answers
    const auto received = pair.receiver->Statistics();
    REQUIRE(received.duplicate_frames == 3);
    REQUIRE(received.acks_sent == 4);
    REQUIRE(pair.receiver->State() == TransferState::Complete);
}

TEST_CASE("Transfer Failures - Output that cannot be committed", "[integration][failure][io]") {
    SessionPair pair;
    pair.Handshake();
    RefusingSink sink;
    const auto data = PatternBytes(147 * 2 + 6, 2);

    auto received = std::async(std::launch::async, [&]() {
        return pair.receiver->ReceiveStream(sink);
    });
    auto sent = pair.sender->Send(data);
    auto result = received.get();

    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == TransferFailureType::Generic);
    REQUIRE(sink.discarded);
    REQUIRE(sink.written == data.size());
    REQUIRE(pair.receiver->State() == TransferState::Failed);

    // The final frame is never acknowledged, so the sender cannot report success
    REQUIRE(pair.receiver->Statistics().acks_sent == 2);
    REQUIRE(sent.IsErr());
    REQUIRE(sent.UnwrapErr().type == TransferFailureType::FrameTimeout);
    REQUIRE(pair.sender->State() == TransferState::Failed);
}

TEST_CASE("Transfer Failures - Event handler queries the link on disconnect", "[integration][failure][disconnect]") {
    auto link = LoopbackLink::Create();
    auto sender_events = std::make_shared<LinkStateHandler>(link);
    auto receiver_events = std::make_shared<LinkStateHandler>(link);
    auto sender = TransferSession::Create(
        link->Endpoint(LinkSide::A), TransferRole::Sender, TransferConfig::Aggressive(), sender_events).Unwrap();
    auto receiver = TransferSession::Create(
        link->Endpoint(LinkSide::B), TransferRole::Receiver, TransferConfig::Aggressive(), receiver_events).Unwrap();

    auto peer = std::async(std::launch::async, [&]() { return receiver->Handshake(); });
    REQUIRE(sender->Handshake().IsOk());
    REQUIRE(peer.get().IsOk());

    link->DisconnectAt(LinkSide::A, 1);
    auto received = std::async(std::launch::async, [&]() { return receiver->Receive(); });
    auto sent = sender->Send(PatternBytes(400, 5));
    auto result = received.get();

    REQUIRE(sent.IsErr());
    REQUIRE(result.IsErr());
    REQUIRE(sender_events->ConnectedWhenFailed() == std::vector<bool>{false});
    REQUIRE(receiver_events->ConnectedWhenFailed() == std::vector<bool>{false});
}

TEST_CASE("Transfer Failures - Receiver idle timeout", "[integration][failure][timeout]") {
    auto config = TransferConfig::Aggressive();
    config.receive_idle_timeout = std::chrono::milliseconds{150};
    SessionPair pair(config);
    pair.Handshake();

    auto result = pair.receiver->Receive();
    REQUIRE(result.IsErr());
    REQUIRE(result.UnwrapErr().type == TransferFailureType::FrameTimeout);
    REQUIRE(pair.receiver->State() == TransferState::Failed);
}

TEST_CASE("Transfer Failures - Cancel", "[integration][failure][cancel]") {
    SECTION("During the handshake") {
        auto link = LoopbackLink::Create();
        auto config = TransferConfig::Aggressive();
        config.handshake_timeout = std::chrono::milliseconds{5000};
        auto sender = MakeSession(link, LinkSide::A, TransferRole::Sender, config);

        auto handshake = std::async(std::launch::async, [&]() { return sender->Handshake(); });
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        const auto started = std::chrono::steady_clock::now();
        sender->Cancel();
        auto result = handshake.get();

        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::TransportError);
        REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::milliseconds{2000});
        REQUIRE(sender->State() == TransferState::Failed);
        REQUIRE_FALSE(sender->HasKeyMaterial());
    }

    SECTION("During a blocked receive") {
        SessionPair pair;
        pair.Handshake();

        auto received = std::async(std::launch::async, [&]() { return pair.receiver->Receive(); });
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        pair.receiver->Cancel();
        auto result = received.get();

        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::TransportError);
        REQUIRE(pair.receiver->State() == TransferState::Failed);
        REQUIRE_FALSE(pair.receiver->HasKeyMaterial());
    }

    SECTION("Before the handshake") {
        auto link = LoopbackLink::Create();
        auto sender = MakeSession(link, LinkSide::A, TransferRole::Sender);
        sender->Cancel();

        REQUIRE(sender->State() == TransferState::Failed);
        REQUIRE(sender->LastFailure()->type == TransferFailureType::TransportError);
        auto result = sender->Handshake();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidState);
    }
}
