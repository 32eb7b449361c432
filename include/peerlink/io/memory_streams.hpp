#pragma once
#include "peerlink/interfaces/i_byte_sink.hpp"
#include "peerlink/interfaces/i_byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace peerlink::transfer::io {

class MemoryByteSource final : public interfaces::IByteSource {
public:
    explicit MemoryByteSource(std::vector<uint8_t> data);
    ~MemoryByteSource() override;

    MemoryByteSource(const MemoryByteSource&) = delete;
    MemoryByteSource& operator=(const MemoryByteSource&) = delete;

    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Read(size_t max_bytes) override;
    [[nodiscard]] std::optional<uint64_t> TotalSize() const override;

private:
    std::vector<uint8_t> data_;
    size_t offset_ = 0;
};

/**
 * @brief Collects the received stream in memory
 *
 * Contents() is only available after Commit(); Discard() wipes whatever
 * was written.
 */
class MemoryByteSink final : public interfaces::IByteSink {
public:
    MemoryByteSink() = default;
    ~MemoryByteSink() override;

    MemoryByteSink(const MemoryByteSink&) = delete;
    MemoryByteSink& operator=(const MemoryByteSink&) = delete;

    [[nodiscard]] Result<Unit, TransferFailure> Write(std::span<const uint8_t> bytes) override;
    [[nodiscard]] Result<Unit, TransferFailure> Commit() override;
    void Discard() noexcept override;

    [[nodiscard]] bool IsCommitted() const noexcept { return committed_; }
    [[nodiscard]] bool IsDiscarded() const noexcept { return discarded_; }
    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Contents() const;

private:
    std::vector<uint8_t> buffer_;
    bool committed_ = false;
    bool discarded_ = false;
};

}  // namespace peerlink::transfer::io
