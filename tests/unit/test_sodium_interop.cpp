#include <catch2/catch_test_macros.hpp>
#include "peerlink/crypto/sodium_interop.hpp"
#include <string>
using namespace peerlink::transfer;
using namespace peerlink::transfer::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer succeeds") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
    }
    SECTION("Wipe small buffer zeroes it") {
        std::vector<uint8_t> buffer(100, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(100, 0x00));
    }
    SECTION("Wipe large buffer zeroes it") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        REQUIRE(SodiumInterop::SecureWipe(std::span<uint8_t>(buffer)).IsOk());
        REQUIRE(buffer == std::vector<uint8_t>(10000, 0x00));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap() == true);
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap() == false);
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b).Unwrap() == false);
    }
}

TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto bytes1 = SodiumInterop::GetRandomBytes(32);
    auto bytes2 = SodiumInterop::GetRandomBytes(32);
    REQUIRE(bytes1.size() == 32);
    REQUIRE(bytes1 != bytes2);
    REQUIRE(SodiumInterop::GetRandomBytes(0).empty());
}

TEST_CASE("SodiumInterop - Base64", "[sodium][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("RFC 4648 test vectors") {
        const std::string input = "foobar";
        const std::vector<uint8_t> bytes(input.begin(), input.end());
        REQUIRE(SodiumInterop::Base64Encode(std::span(bytes).first(1)) == "Zg==");
        REQUIRE(SodiumInterop::Base64Encode(std::span(bytes).first(2)) == "Zm8=");
        REQUIRE(SodiumInterop::Base64Encode(std::span(bytes).first(3)) == "Zm9v");
        REQUIRE(SodiumInterop::Base64Encode(bytes) == "Zm9vYmFy");
        REQUIRE(SodiumInterop::Base64Encode(std::span<const uint8_t>()).empty());
    }
    SECTION("Decode restores the input") {
        auto decoded = SodiumInterop::Base64Decode("Zm9vYmE=");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == std::vector<uint8_t>{'f', 'o', 'o', 'b', 'a'});
    }
    SECTION("Malformed input is rejected") {
        REQUIRE(SodiumInterop::Base64Decode("Zm9v!mFy").IsErr());
        REQUIRE(SodiumInterop::Base64Decode("Zm9vYmE").IsErr());
    }
    SECTION("Encoded length matches the encoder") {
        for (size_t n : {0u, 1u, 2u, 3u, 147u, 180u}) {
            std::vector<uint8_t> data(n, 0xAB);
            REQUIRE(SodiumInterop::Base64Encode(data).size() == SodiumInterop::Base64EncodedLength(n));
        }
    }
}
