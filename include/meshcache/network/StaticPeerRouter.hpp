#pragma once

#include "meshcache/Export.hpp"
#include "meshcache/network/Transport.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshcache::network {

// Fixed neighbour table with optional per-chunk provider hints.
class MESHCACHE_API StaticPeerRouter : public PeerRouter {
public:
    StaticPeerRouter() = default;
    explicit StaticPeerRouter(std::vector<PeerId> neighbours);

    void add_neighbour(const PeerId& peer);
    void remove_neighbour(const PeerId& peer);
    void add_hint(const ChunkId& id, const PeerId& provider);
    void clear_hints(const ChunkId& id);

    // Hinted providers first, then the remaining neighbours.
    std::vector<PeerId> candidates_for(const ChunkId& id) const override;
    std::vector<PeerId> neighbours() const override;

private:
    std::vector<PeerId> neighbours_;
    std::unordered_map<std::string, std::vector<PeerId>> hints_;
    mutable std::mutex mutex_;
};

}  // namespace meshcache::network
