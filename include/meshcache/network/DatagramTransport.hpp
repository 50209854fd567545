#pragma once

#include "meshcache/Export.hpp"
#include "meshcache/network/Transport.hpp"
#include "meshcache/protocol/Message.hpp"

#include <functional>
#include <mutex>
#include <span>

namespace meshcache::network {

// Hands encoded datagrams to an opaque link. Returns false when the link refuses.
using DatagramSink = std::function<bool(const PeerId& to, std::span<const std::uint8_t> datagram)>;

/**
 * Transport over any datagram link: encodes outbound calls with the wire
 * codec and decodes inbound datagrams into InboundHandler calls. The hop
 * distance carried on the wire is the sender's; deliver() adds the hop
 * taken to reach this node.
 */
class MESHCACHE_API DatagramTransport : public Transport {
public:
    explicit DatagramTransport(DatagramSink sink);

    void set_handler(InboundHandler* handler);

    bool send_request(const ChunkId& id, const PeerId& to) override;
    bool send_chunk(const ChunkId& id,
                    std::span<const std::uint8_t> payload,
                    const PeerId& to,
                    HopCount hop_distance) override;
    bool send_offer(const ChunkId& id, const PeerId& to, HopCount hop_distance, std::uint32_t size) override;
    bool send_miss(const ChunkId& id, const PeerId& to) override;

    // False for malformed datagrams, which are dropped.
    bool deliver(const PeerId& from, std::span<const std::uint8_t> datagram);

private:
    bool send(const PeerId& to, const protocol::Message& message);

    DatagramSink sink_;
    InboundHandler* handler_{nullptr};
    std::mutex handler_mutex_;
};

}  // namespace meshcache::network
