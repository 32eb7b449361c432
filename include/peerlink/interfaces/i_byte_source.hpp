#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
namespace peerlink::transfer::interfaces {
class IByteSource {
public:
    virtual ~IByteSource() = default;
    /// Up to @p max_bytes; an empty vector marks the end of the stream
    [[nodiscard]] virtual Result<std::vector<uint8_t>, TransferFailure> Read(size_t max_bytes) = 0;
    /// Total length when known up front (used for progress percentages)
    [[nodiscard]] virtual std::optional<uint64_t> TotalSize() const = 0;
};
}
