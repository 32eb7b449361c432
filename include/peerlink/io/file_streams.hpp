#pragma once
#include "peerlink/interfaces/i_byte_sink.hpp"
#include "peerlink/interfaces/i_byte_source.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace peerlink::transfer::io {

/// Reads a file in binary mode; the size is taken when the file is opened
class FileByteSource final : public interfaces::IByteSource {
public:
    [[nodiscard]] static Result<std::unique_ptr<FileByteSource>, TransferFailure> Open(
        const std::filesystem::path& path);

    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Read(size_t max_bytes) override;
    [[nodiscard]] std::optional<uint64_t> TotalSize() const override;

private:
    FileByteSource(std::filesystem::path path, std::ifstream stream, uint64_t size);

    std::filesystem::path path_;
    std::ifstream stream_;
    uint64_t size_;
};

/**
 * @brief File sink that only produces the destination on success
 *
 * Bytes go to `<path>.part`. Commit() flushes and renames it onto the
 * destination; Discard(), or destruction without a commit, removes it.
 */
class AtomicFileSink final : public interfaces::IByteSink {
public:
    [[nodiscard]] static Result<std::unique_ptr<AtomicFileSink>, TransferFailure> Create(
        const std::filesystem::path& destination);

    ~AtomicFileSink() override;

    AtomicFileSink(const AtomicFileSink&) = delete;
    AtomicFileSink& operator=(const AtomicFileSink&) = delete;

    [[nodiscard]] Result<Unit, TransferFailure> Write(std::span<const uint8_t> bytes) override;
    [[nodiscard]] Result<Unit, TransferFailure> Commit() override;
    void Discard() noexcept override;

    [[nodiscard]] const std::filesystem::path& Destination() const noexcept { return destination_; }
    [[nodiscard]] const std::filesystem::path& PartialPath() const noexcept { return partial_path_; }
    [[nodiscard]] bool IsCommitted() const noexcept { return committed_; }

    [[nodiscard]] static std::filesystem::path PartialPathFor(const std::filesystem::path& destination);

private:
    AtomicFileSink(std::filesystem::path destination, std::filesystem::path partial_path, std::ofstream stream);

    std::filesystem::path destination_;
    std::filesystem::path partial_path_;
    std::ofstream stream_;
    bool committed_ = false;
    bool closed_ = false;
};

}  // namespace peerlink::transfer::io
