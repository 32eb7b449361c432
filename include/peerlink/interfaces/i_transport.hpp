#pragma once
#include "peerlink/core/result.hpp"
#include "peerlink/core/failures.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
#include <vector>
namespace peerlink::transfer::interfaces {

/**
 * @brief The radio link as seen by a TransferSession
 *
 * Two channels: a handshake channel with acknowledged writes and explicit
 * reads, and a transfer channel with unacknowledged writes whose inbound
 * side arrives through the notification callback. Delivery, ordering and
 * retransmission are not guaranteed; every payload must fit MaxPayloadSize().
 *
 * Callbacks may run on a transport thread. Registering an empty function
 * unregisters; once the setter returns the previous callback is no longer
 * running and will not be called again.
 */
class ITransport {
public:
    using NotifyCallback = std::function<void(std::span<const uint8_t>)>;
    using DisconnectCallback = std::function<void()>;

    virtual ~ITransport() = default;

    [[nodiscard]] virtual std::string_view ServiceId() const = 0;
    [[nodiscard]] virtual std::string_view HandshakeChannelId() const = 0;
    [[nodiscard]] virtual std::string_view TransferChannelId() const = 0;
    [[nodiscard]] virtual size_t MaxPayloadSize() const = 0;

    /// Handshake channel, acknowledged by the link layer
    [[nodiscard]] virtual Result<Unit, TransferFailure> Write(std::span<const uint8_t> bytes) = 0;

    /// Handshake channel; an empty result means the peer has not written yet
    [[nodiscard]] virtual Result<std::vector<uint8_t>, TransferFailure> Read() = 0;

    /// Transfer channel, fire and forget
    [[nodiscard]] virtual Result<Unit, TransferFailure> WriteWithoutAck(std::span<const uint8_t> bytes) = 0;

    virtual void OnNotify(NotifyCallback callback) = 0;
    virtual void OnDisconnect(DisconnectCallback callback) = 0;

    [[nodiscard]] virtual bool IsConnected() const = 0;
};
}
