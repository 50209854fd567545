#pragma once

#include "meshcache/Types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace meshcache::network {

// Outbound side of the mesh. Each call reports whether the substrate
// accepted the datagram; delivery itself is best-effort and unordered.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool send_request(const ChunkId& id, const PeerId& to) = 0;
    virtual bool send_chunk(const ChunkId& id,
                            std::span<const std::uint8_t> payload,
                            const PeerId& to,
                            HopCount hop_distance) = 0;
    virtual bool send_offer(const ChunkId& id, const PeerId& to, HopCount hop_distance, std::uint32_t size) = 0;
    virtual bool send_miss(const ChunkId& id, const PeerId& to) = 0;
};

// Inbound side. Hop distances are already counted from the receiving node.
class InboundHandler {
public:
    virtual ~InboundHandler() = default;

    virtual void handle_offer(const ChunkId& id, const PeerId& from, HopCount hop_distance, std::uint32_t size) = 0;
    virtual void handle_chunk(const ChunkId& id,
                              std::span<const std::uint8_t> payload,
                              const PeerId& from,
                              HopCount hop_distance) = 0;
    virtual void handle_request(const ChunkId& id, const PeerId& from) = 0;
    virtual void handle_miss(const ChunkId& id, const PeerId& from) = 0;
};

class PeerRouter {
public:
    virtual ~PeerRouter() = default;

    // Peers likely to hold id, best first.
    virtual std::vector<PeerId> candidates_for(const ChunkId& id) const = 0;
    // Peers that receive offers for newly published chunks.
    virtual std::vector<PeerId> neighbours() const = 0;
};

}  // namespace meshcache::network
