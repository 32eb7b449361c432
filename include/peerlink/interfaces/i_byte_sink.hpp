#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include <cstdint>
#include <span>
namespace peerlink::transfer::interfaces {

/**
 * @brief Destination of a received stream
 *
 * Data written before Commit() is provisional. A session that fails calls
 * Discard(), after which nothing written so far may be observable as a
 * valid output.
 */
class IByteSink {
public:
    virtual ~IByteSink() = default;
    [[nodiscard]] virtual Result<Unit, TransferFailure> Write(std::span<const uint8_t> bytes) = 0;
    [[nodiscard]] virtual Result<Unit, TransferFailure> Commit() = 0;
    virtual void Discard() noexcept = 0;
};
}
