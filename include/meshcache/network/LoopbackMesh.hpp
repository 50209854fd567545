#pragma once

#include "meshcache/Export.hpp"
#include "meshcache/network/DatagramTransport.hpp"
#include "meshcache/protocol/Message.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace meshcache::network {

/**
 * In-process mesh for deterministic multi-node scenarios.
 *
 * Datagrams are queued on send and handed over only by pump(). An offline
 * node neither sends nor receives; datagrams addressed to it are dropped at
 * delivery time and still counted, so tests can prove nothing reached it.
 */
class MESHCACHE_API LoopbackMesh {
public:
    struct Datagram {
        PeerId from{};
        PeerId to{};
        std::vector<std::uint8_t> bytes;
    };

    LoopbackMesh() = default;
    LoopbackMesh(const LoopbackMesh&) = delete;
    LoopbackMesh& operator=(const LoopbackMesh&) = delete;

    DatagramTransport& attach(const PeerId& peer);
    void set_online(const PeerId& peer, bool online);
    bool online(const PeerId& peer) const;

    // Delivers queued datagrams, including ones sent while pumping, until the
    // queue drains or max_deliveries is reached. Returns deliveries made.
    std::size_t pump(std::size_t max_deliveries = 10'000);

    std::size_t queued() const noexcept {
        return queue_.size();
    }

    std::size_t addressed_to(const PeerId& peer, protocol::MessageType type) const;
    std::size_t dropped() const noexcept {
        return dropped_;
    }

private:
    struct Node {
        std::unique_ptr<DatagramTransport> transport;
        bool online{true};
    };

    bool enqueue(const PeerId& from, const PeerId& to, std::span<const std::uint8_t> bytes);

    std::map<PeerId, Node> nodes_;
    std::deque<Datagram> queue_;
    std::map<std::pair<PeerId, protocol::MessageType>, std::size_t> addressed_;
    std::size_t dropped_{0};
};

}  // namespace meshcache::network
