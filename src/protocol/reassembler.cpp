#include "peerlink/protocol/reassembler.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include "peerlink/core/format.hpp"
#include <algorithm>

namespace peerlink::transfer::protocol {

    using crypto::SodiumInterop;

    Reassembler::~Reassembler() {
        Clear();
    }

    void Reassembler::Append(const uint32_t sequence_number, std::span<const uint8_t> plaintext) {
        buffer_.insert(buffer_.end(), plaintext.begin(), plaintext.end());
        last_sequence_number_ = sequence_number;
        ++chunk_count_;
    }

    Result<std::vector<uint8_t>, TransferFailure> Reassembler::Finalize() const {
        if (!finalized_) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::IncompleteTransfer(
                    compat::format("Stream not finalized: {} chunks, {} bytes buffered, no final chunk",
                        chunk_count_, buffer_.size())));
        }
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(buffer_);
    }

    void Reassembler::Clear() noexcept {
        if (!buffer_.empty() && SodiumInterop::SecureWipe(std::span<uint8_t>(buffer_)).IsErr()) {
            std::fill(buffer_.begin(), buffer_.end(), uint8_t{0});
        }
        std::vector<uint8_t>().swap(buffer_);
        chunk_count_ = 0;
        last_sequence_number_ = 0;
        finalized_ = false;
    }

}
