#include "peerlink/transport/loopback_link.hpp"
#include "peerlink/core/format.hpp"
#include <string>

namespace peerlink::transfer::transport {

class LoopbackTransport final : public interfaces::ITransport {
public:
    LoopbackTransport(std::shared_ptr<LoopbackLink> link, const LinkSide side)
        : link_(std::move(link))
        , side_(side) {
    }

    [[nodiscard]] std::string_view ServiceId() const override {
        return kDefaultServiceId;
    }

    [[nodiscard]] std::string_view HandshakeChannelId() const override {
        return kDefaultHandshakeChannelId;
    }

    [[nodiscard]] std::string_view TransferChannelId() const override {
        return kDefaultTransferChannelId;
    }

    [[nodiscard]] size_t MaxPayloadSize() const override {
        return link_->MaxPayloadSize();
    }

    [[nodiscard]] Result<Unit, TransferFailure> Write(std::span<const uint8_t> bytes) override {
        return link_->WriteHandshake(side_, bytes);
    }

    [[nodiscard]] Result<std::vector<uint8_t>, TransferFailure> Read() override {
        return link_->ReadHandshake(side_);
    }

    [[nodiscard]] Result<Unit, TransferFailure> WriteWithoutAck(std::span<const uint8_t> bytes) override {
        return link_->WriteTransfer(side_, bytes);
    }

    void OnNotify(NotifyCallback callback) override {
        link_->SetNotify(side_, std::move(callback));
    }

    void OnDisconnect(DisconnectCallback callback) override {
        link_->SetDisconnect(side_, std::move(callback));
    }

    [[nodiscard]] bool IsConnected() const override {
        return link_->IsConnected();
    }

private:
    std::shared_ptr<LoopbackLink> link_;
    LinkSide side_;
};

std::shared_ptr<LoopbackLink> LoopbackLink::Create(const size_t max_payload_size) {
    return std::shared_ptr<LoopbackLink>(new LoopbackLink(max_payload_size));
}

LoopbackLink::LoopbackLink(const size_t max_payload_size)
    : max_payload_size_(max_payload_size) {
}

std::shared_ptr<interfaces::ITransport> LoopbackLink::Endpoint(const LinkSide side) {
    // Endpoints keep the link alive; the link holds no reference back
    return std::make_shared<LoopbackTransport>(shared_from_this(), side);
}

void LoopbackLink::DropOutbound(const LinkSide side, const size_t write_index) {
    std::lock_guard lock(mutex_);
    sides_[Index(side)].drops.insert(write_index);
}

void LoopbackLink::TamperOutbound(const LinkSide side, const size_t write_index, const size_t byte_offset) {
    std::lock_guard lock(mutex_);
    sides_[Index(side)].tampers[write_index] = byte_offset;
}

void LoopbackLink::DisconnectAt(const LinkSide side, const size_t write_index) {
    std::lock_guard lock(mutex_);
    sides_[Index(side)].disconnect_at.insert(write_index);
}

void LoopbackLink::Disconnect() {
    bool broke_link;
    {
        std::lock_guard lock(mutex_);
        broke_link = MarkDisconnectedLocked();
    }
    if (broke_link) {
        DispatchDisconnect();
    }
}

bool LoopbackLink::MarkDisconnectedLocked() {
    if (!connected_) {
        return false;
    }
    connected_ = false;
    for (auto& side : sides_) {
        side.handshake_inbox.clear();
    }
    return true;
}

void LoopbackLink::DispatchDisconnect() {
    std::lock_guard dispatch(dispatch_mutex_);
    for (auto& side : sides_) {
        if (side.on_disconnect) {
            side.on_disconnect();
        }
    }
}

bool LoopbackLink::IsConnected() const {
    std::lock_guard lock(mutex_);
    return connected_;
}

std::vector<std::vector<uint8_t>> LoopbackLink::Sent(const LinkSide side) const {
    std::lock_guard lock(mutex_);
    return sides_[Index(side)].sent;
}

Result<Unit, TransferFailure> LoopbackLink::WriteHandshake(const LinkSide from, std::span<const uint8_t> bytes) {
    std::lock_guard lock(mutex_);
    if (!connected_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::TransportError("Link is disconnected"));
    }
    if (bytes.size() > max_payload_size_) {
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::TransportError(
                compat::format("Payload of {} bytes exceeds link MTU {}", bytes.size(), max_payload_size_)));
    }
    sides_[Index(Peer(from))].handshake_inbox.emplace_back(bytes.begin(), bytes.end());
    return Result<Unit, TransferFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, TransferFailure> LoopbackLink::ReadHandshake(const LinkSide side) {
    std::lock_guard lock(mutex_);
    if (!connected_) {
        return Result<std::vector<uint8_t>, TransferFailure>::Err(
            TransferFailure::TransportError("Link is disconnected"));
    }
    auto& inbox = sides_[Index(side)].handshake_inbox;
    if (inbox.empty()) {
        return Result<std::vector<uint8_t>, TransferFailure>::Ok({});
    }
    std::vector<uint8_t> message = std::move(inbox.front());
    inbox.pop_front();
    return Result<std::vector<uint8_t>, TransferFailure>::Ok(std::move(message));
}

Result<Unit, TransferFailure> LoopbackLink::WriteTransfer(const LinkSide from, std::span<const uint8_t> bytes) {
    std::vector<uint8_t> delivered;
    bool broke_link = false;
    {
        std::lock_guard lock(mutex_);
        if (!connected_) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::TransportError("Link is disconnected"));
        }
        if (bytes.size() > max_payload_size_) {
            return Result<Unit, TransferFailure>::Err(
                TransferFailure::TransportError(
                    compat::format("Payload of {} bytes exceeds link MTU {}", bytes.size(), max_payload_size_)));
        }

        auto& sender = sides_[Index(from)];
        const size_t write_index = sender.sent.size();
        sender.sent.emplace_back(bytes.begin(), bytes.end());

        if (sender.disconnect_at.contains(write_index)) {
            broke_link = MarkDisconnectedLocked();
        } else if (sender.drops.contains(write_index)) {
            return Result<Unit, TransferFailure>::Ok(unit);
        } else {
            delivered.assign(bytes.begin(), bytes.end());
            if (const auto it = sender.tampers.find(write_index);
                it != sender.tampers.end() && it->second < delivered.size()) {
                delivered[it->second] ^= 0x01;
            }
        }
    }

    if (broke_link) {
        DispatchDisconnect();
        return Result<Unit, TransferFailure>::Err(
            TransferFailure::TransportError("Link is disconnected"));
    }

    std::lock_guard dispatch(dispatch_mutex_);
    auto& receiver = sides_[Index(Peer(from))];
    if (receiver.notify) {
        receiver.notify(delivered);
    }
    return Result<Unit, TransferFailure>::Ok(unit);
}

void LoopbackLink::SetNotify(const LinkSide side, interfaces::ITransport::NotifyCallback callback) {
    std::lock_guard dispatch(dispatch_mutex_);
    sides_[Index(side)].notify = std::move(callback);
}

void LoopbackLink::SetDisconnect(const LinkSide side, interfaces::ITransport::DisconnectCallback callback) {
    std::lock_guard dispatch(dispatch_mutex_);
    sides_[Index(side)].on_disconnect = std::move(callback);
}

}  // namespace peerlink::transfer::transport
