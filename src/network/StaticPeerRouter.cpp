#include "meshcache/network/StaticPeerRouter.hpp"

#include <algorithm>
#include <utility>

namespace meshcache::network {

namespace {

void push_unique(std::vector<PeerId>& peers, const PeerId& peer) {
    if (std::find(peers.begin(), peers.end(), peer) == peers.end()) {
        peers.push_back(peer);
    }
}

}  // namespace

StaticPeerRouter::StaticPeerRouter(std::vector<PeerId> neighbours) {
    for (const auto& peer : neighbours) {
        push_unique(neighbours_, peer);
    }
}

void StaticPeerRouter::add_neighbour(const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    push_unique(neighbours_, peer);
}

void StaticPeerRouter::remove_neighbour(const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    neighbours_.erase(std::remove(neighbours_.begin(), neighbours_.end(), peer), neighbours_.end());
}

void StaticPeerRouter::add_hint(const ChunkId& id, const PeerId& provider) {
    std::scoped_lock lock(mutex_);
    push_unique(hints_[chunk_id_to_string(id)], provider);
}

void StaticPeerRouter::clear_hints(const ChunkId& id) {
    std::scoped_lock lock(mutex_);
    hints_.erase(chunk_id_to_string(id));
}

std::vector<PeerId> StaticPeerRouter::candidates_for(const ChunkId& id) const {
    std::scoped_lock lock(mutex_);
    std::vector<PeerId> candidates;
    if (const auto it = hints_.find(chunk_id_to_string(id)); it != hints_.end()) {
        candidates = it->second;
    }
    for (const auto& peer : neighbours_) {
        push_unique(candidates, peer);
    }
    return candidates;
}

std::vector<PeerId> StaticPeerRouter::neighbours() const {
    std::scoped_lock lock(mutex_);
    return neighbours_;
}

}  // namespace meshcache::network
