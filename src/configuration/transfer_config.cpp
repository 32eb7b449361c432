#include "peerlink/configuration/transfer_config.hpp"
#include "peerlink/protocol/frame_codec.hpp"
#include "peerlink/core/format.hpp"

namespace peerlink::transfer::configuration {

Result<Unit, TransferFailure> TransferConfig::Validate() const {
    if (ack_timeout.count() <= 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("ack_timeout must be positive"));
    }
    if (handshake_timeout.count() <= 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("handshake_timeout must be positive"));
    }
    if (handshake_poll_interval.count() <= 0 || handshake_poll_interval > handshake_timeout) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput(
                compat::format("handshake_poll_interval must be in (0, {}] ms, got {} ms",
                    handshake_timeout.count(), handshake_poll_interval.count())));
    }
    if (receive_idle_timeout.count() <= 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("receive_idle_timeout must be positive"));
    }
    if (read_block_size == 0) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::InvalidInput("read_block_size must be positive"));
    }
    auto chunk = ChunkSize();
    if (chunk.IsErr()) {
        return Result<Unit, TransferFailure>::Err(std::move(chunk).UnwrapErr());
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<size_t, TransferFailure> TransferConfig::ChunkSize() const {
    return protocol::FrameCodec::MaxPlaintextChunk(max_payload_size, transport_encoding);
}

}
