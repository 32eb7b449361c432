#include "peerlink/io/file_streams.hpp"
#include "peerlink/core/format.hpp"
#include <system_error>

namespace peerlink::transfer::io {

// ============================================================================
// FileByteSource
// ============================================================================

Result<std::unique_ptr<FileByteSource>, TransferFailure> FileByteSource::Open(
    const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Result<std::unique_ptr<FileByteSource>, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("Cannot stat {}: {}", path.string(), ec.message())));
    }
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        return Result<std::unique_ptr<FileByteSource>, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("Cannot open {} for reading", path.string())));
    }
    return Result<std::unique_ptr<FileByteSource>, TransferFailure>::Ok(
        std::unique_ptr<FileByteSource>(new FileByteSource(path, std::move(stream), size)));
}

FileByteSource::FileByteSource(std::filesystem::path path, std::ifstream stream, const uint64_t size)
    : path_(std::move(path))
    , stream_(std::move(stream))
    , size_(size) {
}

Result<std::vector<uint8_t>, TransferFailure> FileByteSource::Read(const size_t max_bytes) {
    if (max_bytes == 0) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::InvalidInput("Read size must be positive"));
    }
    std::vector<uint8_t> block(max_bytes);
    stream_.read(reinterpret_cast<char*>(block.data()), static_cast<std::streamsize>(max_bytes));
    if (stream_.bad()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::Generic(compat::format("Read error on {}", path_.string())));
    }
    block.resize(static_cast<size_t>(stream_.gcount()));
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(block));
}

std::optional<uint64_t> FileByteSource::TotalSize() const {
    return size_;
}

// ============================================================================
// AtomicFileSink
// ============================================================================

std::filesystem::path AtomicFileSink::PartialPathFor(const std::filesystem::path& destination) {
    std::filesystem::path partial = destination;
    partial += ".part";
    return partial;
}

Result<std::unique_ptr<AtomicFileSink>, TransferFailure> AtomicFileSink::Create(
    const std::filesystem::path& destination) {
    auto partial_path = PartialPathFor(destination);
    std::ofstream stream(partial_path, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        return Result<std::unique_ptr<AtomicFileSink>, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("Cannot create {}", partial_path.string())));
    }
    return Result<std::unique_ptr<AtomicFileSink>, TransferFailure>::Ok(
        std::unique_ptr<AtomicFileSink>(
            new AtomicFileSink(destination, std::move(partial_path), std::move(stream))));
}

AtomicFileSink::AtomicFileSink(
    std::filesystem::path destination,
    std::filesystem::path partial_path,
    std::ofstream stream)
    : destination_(std::move(destination))
    , partial_path_(std::move(partial_path))
    , stream_(std::move(stream)) {
}

AtomicFileSink::~AtomicFileSink() {
    if (!committed_) {
        Discard();
    }
}

Result<Unit, TransferFailure> AtomicFileSink::Write(std::span<const uint8_t> bytes) {
    if (closed_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState("Sink is already closed"));
    }
    stream_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!stream_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Generic(compat::format("Write error on {}", partial_path_.string())));
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<Unit, TransferFailure> AtomicFileSink::Commit() {
    if (closed_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidState("Sink is already closed"));
    }
    stream_.flush();
    stream_.close();
    if (stream_.fail()) {
        Discard();
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Generic(compat::format("Flush failed on {}", partial_path_.string())));
    }
    std::error_code ec;
    std::filesystem::rename(partial_path_, destination_, ec);
    if (ec) {
        Discard();
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::Generic(
                compat::format("Cannot move {} to {}: {}",
                    partial_path_.string(), destination_.string(), ec.message())));
    }
    closed_ = true;
    committed_ = true;
    return Result<Unit, TransferFailure>::Ok(unit);
}

void AtomicFileSink::Discard() noexcept {
    if (committed_) {
        return;
    }
    if (stream_.is_open()) {
        stream_.close();
    }
    closed_ = true;
    std::error_code ec;
    std::filesystem::remove(partial_path_, ec);
}

}  // namespace peerlink::transfer::io
