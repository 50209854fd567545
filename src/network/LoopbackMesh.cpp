#include "meshcache/network/LoopbackMesh.hpp"

#include <utility>

namespace meshcache::network {

DatagramTransport& LoopbackMesh::attach(const PeerId& peer) {
    auto& node = nodes_[peer];
    if (!node.transport) {
        node.transport = std::make_unique<DatagramTransport>(
            [this, peer](const PeerId& to, std::span<const std::uint8_t> bytes) {
                return enqueue(peer, to, bytes);
            });
    }
    return *node.transport;
}

void LoopbackMesh::set_online(const PeerId& peer, bool online) {
    if (const auto it = nodes_.find(peer); it != nodes_.end()) {
        it->second.online = online;
    }
}

bool LoopbackMesh::online(const PeerId& peer) const {
    const auto it = nodes_.find(peer);
    return it != nodes_.end() && it->second.online;
}

bool LoopbackMesh::enqueue(const PeerId& from, const PeerId& to, std::span<const std::uint8_t> bytes) {
    if (!online(from) || nodes_.find(to) == nodes_.end()) {
        return false;
    }
    if (bytes.size() >= 2) {
        ++addressed_[{to, static_cast<protocol::MessageType>(bytes[1])}];
    }
    queue_.push_back(Datagram{from, to, std::vector<std::uint8_t>(bytes.begin(), bytes.end())});
    return true;
}

std::size_t LoopbackMesh::pump(std::size_t max_deliveries) {
    std::size_t delivered = 0;
    while (!queue_.empty() && delivered < max_deliveries) {
        auto datagram = std::move(queue_.front());
        queue_.pop_front();

        const auto it = nodes_.find(datagram.to);
        if (it == nodes_.end() || !it->second.online) {
            ++dropped_;
            continue;
        }
        it->second.transport->deliver(datagram.from, datagram.bytes);
        ++delivered;
    }
    return delivered;
}

std::size_t LoopbackMesh::addressed_to(const PeerId& peer, protocol::MessageType type) const {
    const auto it = addressed_.find({peer, type});
    return it == addressed_.end() ? 0 : it->second;
}

}  // namespace meshcache::network
