#include "peerlink/io/memory_streams.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include <algorithm>

namespace peerlink::transfer::io {

using crypto::SodiumInterop;

MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data)
    : data_(std::move(data)) {
}

MemoryByteSource::~MemoryByteSource() {
    (void)SodiumInterop::SecureWipe(std::span(data_));
}

Result<std::vector<uint8_t>, TransferFailure> MemoryByteSource::Read(const size_t max_bytes) {
    if (max_bytes == 0) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidInput("Read size must be positive"));
    }
    const size_t n = std::min(max_bytes, data_.size() - offset_);
    std::vector<uint8_t> block(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
                               data_.begin() + static_cast<std::ptrdiff_t>(offset_ + n));
    offset_ += n;
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(block));
}

std::optional<uint64_t> MemoryByteSource::TotalSize() const {
    return data_.size();
}

MemoryByteSink::~MemoryByteSink() {
    (void)SodiumInterop::SecureWipe(std::span(buffer_));
}

Result<Unit, TransferFailure> MemoryByteSink::Write(std::span<const uint8_t> bytes) {
    if (committed_ || discarded_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState("Sink is already closed"));
    }
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> MemoryByteSink::Commit() {
    if (discarded_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState("Sink was discarded"));
    }
    committed_ = true;
    return Result<Unit, TransferFailure>::Ok(unit);
}

void MemoryByteSink::Discard() noexcept {
    if (committed_) {
        return;
    }
    (void)SodiumInterop::SecureWipe(std::span(buffer_));
    std::vector<uint8_t>().swap(buffer_);
    discarded_ = true;
}

Result<std::vector<uint8_t>, TransferFailure> MemoryByteSink::Contents() const {
    if (!committed_) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::IncompleteTransfer("Sink has not been committed"));
    }
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(buffer_);
}

}  // namespace peerlink::transfer::io
