#include <catch2/catch_test_macros.hpp>
#include "peerlink/configuration/transfer_config.hpp"

using namespace peerlink::transfer;
using namespace peerlink::transfer::configuration;
using namespace std::chrono_literals;

TEST_CASE("TransferConfig - Presets", "[config]") {
    SECTION("Default matches the reference radio profile") {
        constexpr auto config = TransferConfig::Default();
        REQUIRE(config.max_payload_size == 180);
        REQUIRE(config.transport_encoding == TransportEncoding::Binary);
        REQUIRE(config.max_retransmissions == kDefaultMaxRetransmissions);
        REQUIRE(config.Validate().IsOk());
        REQUIRE(config.ChunkSize().Unwrap() == 147);
    }
    SECTION("TextSafe uses base64") {
        constexpr auto config = TransferConfig::TextSafe();
        REQUIRE(config.transport_encoding == TransportEncoding::Base64);
        REQUIRE(config.Validate().IsOk());
        REQUIRE(config.ChunkSize().Unwrap() == 102);
    }
    SECTION("Aggressive shortens every timeout") {
        constexpr auto config = TransferConfig::Aggressive();
        REQUIRE(config.ack_timeout < TransferConfig::Default().ack_timeout);
        REQUIRE(config.handshake_timeout < TransferConfig::Default().handshake_timeout);
        REQUIRE(config.Validate().IsOk());
    }
}

TEST_CASE("TransferConfig - Validation", "[config]") {
    auto config = TransferConfig::Default();
    auto expect_invalid = [](const TransferConfig& c) {
        auto result = c.Validate();
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == TransferFailureType::InvalidInput);
    };
    SECTION("Payload too small for the frame overhead") {
        config.max_payload_size = kFrameOverheadBytes;
        expect_invalid(config);
        config.max_payload_size = kMinimumMaxPayloadBytes;
        REQUIRE(config.Validate().IsOk());
    }
    SECTION("Base64 payload too small") {
        config.transport_encoding = TransportEncoding::Base64;
        config.max_payload_size = 44;
        expect_invalid(config);
    }
    SECTION("Non-positive timeouts") {
        config.ack_timeout = 0ms;
        expect_invalid(config);
    }
    SECTION("Poll interval longer than the handshake timeout") {
        config.handshake_poll_interval = config.handshake_timeout + 1ms;
        expect_invalid(config);
    }
    SECTION("Zero read block") {
        config.read_block_size = 0;
        expect_invalid(config);
    }
    SECTION("Zero retransmissions is allowed") {
        config.max_retransmissions = 0;
        REQUIRE(config.Validate().IsOk());
    }
}
