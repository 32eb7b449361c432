#include <catch2/catch_test_macros.hpp>
#include "peerlink/crypto/sodium_secure_memory_handle.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include <algorithm>
using namespace peerlink::transfer;
using namespace peerlink::transfer::crypto;
TEST_CASE("SecureMemoryHandle - Allocation", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Allocate valid size") {
        auto result = SecureMemoryHandle::Allocate(32);
        REQUIRE(result.IsOk());
        auto handle = std::move(result).Unwrap();
        REQUIRE_FALSE(handle.IsInvalid());
        REQUIRE(handle.Size() == 32);
    }
    SECTION("Cannot allocate zero bytes") {
        REQUIRE(SecureMemoryHandle::Allocate(0).IsErr());
    }
    SECTION("FromBytes copies the input") {
        const std::vector<uint8_t> key(32, 0x5A);
        auto handle = SecureMemoryHandle::FromBytes(key).Unwrap();
        REQUIRE(handle.Size() == key.size());
        REQUIRE(handle.ReadBytes(32).Unwrap() == key);
    }
    SECTION("Default handle is invalid") {
        SecureMemoryHandle handle;
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Size() == 0);
    }
}
TEST_CASE("SecureMemoryHandle - Move Semantics", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Move construction transfers ownership") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        SecureMemoryHandle handle2(std::move(handle1));
        REQUIRE(handle1.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
    SECTION("Move assignment releases the previous allocation") {
        auto handle1 = SecureMemoryHandle::Allocate(32).Unwrap();
        auto handle2 = SecureMemoryHandle::Allocate(64).Unwrap();
        handle2 = std::move(handle1);
        REQUIRE(handle1.IsInvalid());
        REQUIRE(handle2.Size() == 32);
    }
}
TEST_CASE("SecureMemoryHandle - Write and Read", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Short write zero-fills the remainder") {
        auto handle = SecureMemoryHandle::Allocate(8).Unwrap();
        REQUIRE(handle.Write(std::vector<uint8_t>(8, 0xFF)).IsOk());
        REQUIRE(handle.Write(std::vector<uint8_t>{1, 2, 3}).IsOk());
        REQUIRE(handle.ReadBytes(8).Unwrap() == std::vector<uint8_t>{1, 2, 3, 0, 0, 0, 0, 0});
    }
    SECTION("Write larger than buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(16).Unwrap();
        auto result = handle.Write(std::vector<uint8_t>(32, 0x42));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == SodiumFailureType::BufferTooSmall);
    }
    SECTION("Read into too-small buffer fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        std::vector<uint8_t> buffer(16);
        REQUIRE(handle.Read(buffer).IsErr());
    }
    SECTION("ReadBytes beyond the allocation fails") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        REQUIRE(handle.ReadBytes(64).IsErr());
    }
    SECTION("Operations on a reset handle fail") {
        auto handle = SecureMemoryHandle::Allocate(32).Unwrap();
        handle.Reset();
        REQUIRE(handle.IsInvalid());
        REQUIRE(handle.Write(std::vector<uint8_t>(4, 1)).IsErr());
        REQUIRE(handle.ReadBytes(4).IsErr());
        auto access = handle.WithReadAccess([](std::span<const uint8_t>) { return 0; });
        REQUIRE(access.IsErr());
    }
}
TEST_CASE("SecureMemoryHandle - WithReadAccess", "[crypto][memory]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto handle = SecureMemoryHandle::FromBytes(std::vector<uint8_t>(32, 0x42)).Unwrap();
    auto result = handle.WithReadAccess([](std::span<const uint8_t> span) {
        return span.size() == 32 &&
               std::all_of(span.begin(), span.end(), [](uint8_t b) { return b == 0x42; });
    });
    REQUIRE(result.IsOk());
    REQUIRE(result.Unwrap());
}
