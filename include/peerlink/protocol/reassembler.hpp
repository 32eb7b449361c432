#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace peerlink::transfer::protocol {

/**
 * @brief Accumulates decrypted chunks in arrival order
 *
 * Ordering is enforced by TransferSession before Append() is called.
 * Finalize() refuses to produce a result until the chunk carrying is_last
 * has been appended (MarkFinal()).
 */
class Reassembler {
public:
    Reassembler() = default;
    ~Reassembler();

    Reassembler(Reassembler&&) noexcept = default;
    Reassembler& operator=(Reassembler&&) noexcept = default;
    Reassembler(const Reassembler&) = delete;
    Reassembler& operator=(const Reassembler&) = delete;

    void Append(uint32_t sequence_number, std::span<const uint8_t> plaintext);

    void MarkFinal() noexcept {
        finalized_ = true;
    }

    [[nodiscard]] bool IsFinalized() const noexcept {
        return finalized_;
    }

    /**
     * @brief Concatenated stream; Err(IncompleteTransfer) before MarkFinal()
     */
    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Finalize() const;

    [[nodiscard]] size_t ByteCount() const noexcept {
        return buffer_.size();
    }

    [[nodiscard]] size_t ChunkCount() const noexcept {
        return chunk_count_;
    }

    [[nodiscard]] uint32_t LastSequenceNumber() const noexcept {
        return last_sequence_number_;
    }

    /// Wipes buffered plaintext and returns to the empty, non-final state
    void Clear() noexcept;

private:
    std::vector<uint8_t> buffer_;
    size_t chunk_count_ = 0;
    uint32_t last_sequence_number_ = 0;
    bool finalized_ = false;
};

}  // namespace peerlink::transfer::protocol
