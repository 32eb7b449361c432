#include "peerlink/protocol/frame.hpp"

namespace peerlink::transfer::protocol {

FrameHeaderBytes Frame::Header() const noexcept {
    FrameHeaderBytes header{};
    StoreBigEndian32(sequence_number, std::span<uint8_t, 4>(header.data(), 4));
    header[kSequenceNumberBytes] = Flags();
    return header;
}

}
