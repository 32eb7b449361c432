#include "peerlink/protocol/frame_codec.hpp"
#include "peerlink/crypto/sodium_interop.hpp"
#include "peerlink/core/format.hpp"
#include <algorithm>
#include <string_view>

namespace peerlink::transfer::protocol {

    using crypto::SodiumInterop;

    namespace {
        constexpr size_t kNonceOffset = kFrameHeaderBytes;
        constexpr size_t kCiphertextOffset = kNonceOffset + kAesGcmNonceBytes;
    }

    Result<std::vector<uint8_t>, TransferFailure> FrameCodec::Serialize(
        const Frame& frame,
        const size_t max_frame_bytes) {
        const size_t wire_size = frame.WireSize();
        if (wire_size > max_frame_bytes) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::Encode(
                    compat::format("Frame {} is {} bytes, exceeds payload budget of {} bytes",
                        frame.sequence_number, wire_size, max_frame_bytes)));
        }

        std::vector<uint8_t> out;
        out.reserve(wire_size);
        const auto header = frame.Header();
        out.insert(out.end(), header.begin(), header.end());
        out.insert(out.end(), frame.nonce.begin(), frame.nonce.end());
        out.insert(out.end(), frame.ciphertext.begin(), frame.ciphertext.end());
        out.insert(out.end(), frame.auth_tag.begin(), frame.auth_tag.end());
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(out));
    }

    Result<Frame, TransferFailure> FrameCodec::Parse(std::span<const uint8_t> bytes) {
        if (bytes.size() < kFrameOverheadBytes) {
            return Result<Frame, TransferFailure>::Err(
                TransferFailure::Decode(
                    compat::format("Frame too short: {} bytes (minimum {})",
                        bytes.size(), kFrameOverheadBytes)));
        }

        const uint8_t flags = bytes[kSequenceNumberBytes];
        if ((flags & kReservedFlagsMask) != 0) {
            return Result<Frame, TransferFailure>::Err(
                TransferFailure::Decode(
                    compat::format("Reserved frame flag bits set: 0x{:02x}", flags)));
        }

        Frame frame;
        frame.sequence_number = LoadBigEndian32(bytes.subspan<0, kSequenceNumberBytes>());
        frame.is_last = (flags & kFlagIsLast) != 0;

        const auto nonce = bytes.subspan(kNonceOffset, kAesGcmNonceBytes);
        std::copy(nonce.begin(), nonce.end(), frame.nonce.begin());

        const size_t ciphertext_len = bytes.size() - kFrameOverheadBytes;
        const auto ciphertext = bytes.subspan(kCiphertextOffset, ciphertext_len);
        frame.ciphertext.assign(ciphertext.begin(), ciphertext.end());

        const auto tag = bytes.subspan(kCiphertextOffset + ciphertext_len, kAesGcmTagBytes);
        std::copy(tag.begin(), tag.end(), frame.auth_tag.begin());

        return Result<Frame, TransferFailure>::Ok(std::move(frame));
    }

    std::array<uint8_t, kAckBytes> FrameCodec::SerializeAck(const Acknowledgment& ack) noexcept {
        std::array<uint8_t, kAckBytes> out{};
        StoreBigEndian32(ack.sequence_number, std::span<uint8_t, 4>(out.data(), 4));
        return out;
    }

    Result<Acknowledgment, TransferFailure> FrameCodec::ParseAck(std::span<const uint8_t> bytes) {
        if (bytes.size() != kAckBytes) {
            return Result<Acknowledgment, TransferFailure>::Err(
                TransferFailure::Decode(
                    compat::format("Acknowledgment must be {} bytes, got {}",
                        kAckBytes, bytes.size())));
        }
        Acknowledgment ack;
        ack.sequence_number = LoadBigEndian32(bytes.subspan<0, kAckBytes>());
        return Result<Acknowledgment, TransferFailure>::Ok(ack);
    }

    size_t FrameCodec::FrameBudget(const size_t max_payload, const TransportEncoding encoding) noexcept {
        if (encoding == TransportEncoding::Base64) {
            // Every 4 text characters carry 3 bytes
            return (max_payload / 4) * 3;
        }
        return max_payload;
    }

    Result<size_t, TransferFailure> FrameCodec::MaxPlaintextChunk(
        const size_t max_payload,
        const TransportEncoding encoding) {
        const size_t budget = FrameBudget(max_payload, encoding);
        if (budget <= kFrameOverheadBytes) {
            return Result<size_t, TransferFailure>::Err(
                TransferFailure::InvalidInput(
                    compat::format("Payload budget of {} bytes cannot hold the {}-byte frame overhead plus data",
                        max_payload, kFrameOverheadBytes)));
        }
        return Result<size_t, TransferFailure>::Ok(budget - kFrameOverheadBytes);
    }

    std::vector<uint8_t> FrameCodec::EncodeForTransport(
        std::span<const uint8_t> bytes,
        const TransportEncoding encoding) {
        if (encoding == TransportEncoding::Binary) {
            return {bytes.begin(), bytes.end()};
        }
        const std::string text = SodiumInterop::Base64Encode(bytes);
        return {text.begin(), text.end()};
    }

    Result<std::vector<uint8_t>, TransferFailure> FrameCodec::DecodeFromTransport(
        std::span<const uint8_t> bytes,
        const TransportEncoding encoding) {
        if (encoding == TransportEncoding::Binary) {
            return Result<std::vector<uint8_t>, TransferFailure>::Ok(
                std::vector<uint8_t>(bytes.begin(), bytes.end()));
        }
        const std::string_view text(reinterpret_cast<const char*>(bytes.data()), bytes.size());
        auto decoded = SodiumInterop::Base64Decode(text);
        if (decoded.IsErr()) {
            return Result<std::vector<uint8_t>, TransferFailure>::Err(
                TransferFailure::Decode(decoded.UnwrapErr().message));
        }
        return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(decoded).Unwrap());
    }

}
