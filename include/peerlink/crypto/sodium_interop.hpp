#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include "peerlink/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace peerlink::transfer::crypto {

/**
 * @brief Interop layer for libsodium operations
 *
 * Initialization, CSPRNG, secure wipe, constant-time comparison, guarded
 * allocations and the base64 codec used for text-safe transport channels.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must be called before any other operation. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones
     * with sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different (or sizes differ)
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    // ========================================================================
    // Base64 (transport encoding)
    // ========================================================================

    /**
     * @brief Standard base64 with padding (sodium_base64_VARIANT_ORIGINAL)
     */
    static std::string Base64Encode(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, SodiumFailure> Base64Decode(std::string_view text);

    /**
     * @brief Length of the padded base64 encoding of @p binary_size bytes
     */
    static constexpr size_t Base64EncodedLength(const size_t binary_size) noexcept {
        return ((binary_size + 2) / 3) * 4;
    }

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Allocate guard-paged, mlock'ed memory via sodium_malloc
     *
     * @return Pointer to secure memory, or nullptr on failure
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace peerlink::transfer::crypto
