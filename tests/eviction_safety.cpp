#include "meshcache/crypto/Sha256.hpp"
#include "meshcache/network/LoopbackMesh.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <vector>

using namespace std::chrono_literals;

namespace {

// Chunks a downstream peer is still being served survive a full store, even
// when the evictable ones sit past the first page of the access order.
void served_chunks_survive_local_fetch() {
    meshcache::network::LoopbackMesh mesh;
    const auto holder_id = meshcache::test::make_peer_id(0x11);
    const auto fetcher_id = meshcache::test::make_peer_id(0x12);
    const auto downstream_id = meshcache::test::make_peer_id(0x13);

    meshcache::Config fetcher_config;
    fetcher_config.store_capacity_bytes = 100 * 1000;
    meshcache::test::MeshNode holder(mesh, holder_id, meshcache::Config{});
    meshcache::test::MeshNode fetcher(mesh, fetcher_id, fetcher_config);
    fetcher.router.add_neighbour(holder_id);

    std::vector<meshcache::ChunkId> residents;
    for (int n = 0; n < 100; ++n) {
        residents.push_back(fetcher.store.put(meshcache::test::make_payload(1000, static_cast<std::uint8_t>(n)), 0));
    }
    assert(fetcher.store.used_bytes() == fetcher_config.store_capacity_bytes);

    constexpr std::size_t kServed = 70;
    for (std::size_t n = 0; n < kServed; ++n) {
        fetcher.ledger.register_request(residents[n],
                                        meshcache::RequestKind::Offer,
                                        meshcache::Subscriber::remote(downstream_id),
                                        fetcher.clock);
    }

    const auto wanted = holder.store.put(meshcache::test::make_payload(1000, 0xF0), 0);
    const auto handle = fetcher.coordinator.fetch(wanted);
    mesh.pump();

    assert(fetcher.coordinator.status(handle)->state == meshcache::RequestState::Resolved);
    assert(fetcher.store.has(wanted));
    assert(fetcher.store.chunk_count() == 100);
    for (std::size_t n = 0; n < kServed; ++n) {
        assert(fetcher.store.has(residents[n]));
    }
    assert(!fetcher.store.has(residents[kServed]));
    for (std::size_t n = kServed + 1; n < residents.size(); ++n) {
        assert(fetcher.store.has(residents[n]));
    }

    // Once every resident is spoken for, the next fetch fails rather than evicting one.
    for (std::size_t n = kServed + 1; n < residents.size(); ++n) {
        fetcher.ledger.register_request(residents[n],
                                        meshcache::RequestKind::Offer,
                                        meshcache::Subscriber::remote(downstream_id),
                                        fetcher.clock);
    }
    fetcher.ledger.register_request(wanted,
                                    meshcache::RequestKind::Offer,
                                    meshcache::Subscriber::remote(downstream_id),
                                    fetcher.clock);

    const auto extra = holder.store.put(meshcache::test::make_payload(1000, 0xF1), 0);
    const auto refused = fetcher.coordinator.fetch(extra);
    mesh.pump();

    const auto snapshot = fetcher.coordinator.status(refused);
    assert(snapshot->state == meshcache::RequestState::Failed);
    assert(snapshot->error == meshcache::ErrorCode::Capacity);
    assert(fetcher.listener.failed.back().second == meshcache::ErrorCode::Capacity);
    assert(!fetcher.store.has(extra));
    assert(fetcher.store.has(wanted));
    assert(fetcher.store.chunk_count() == 100);
    for (std::size_t n = 0; n < residents.size(); ++n) {
        assert(n == kServed || fetcher.store.has(residents[n]));
    }
}

// A published file stays resident after its offers lapse, and later
// admissions evict around it.
void published_chunks_outlive_their_offers() {
    meshcache::network::LoopbackMesh mesh;
    const auto publisher_id = meshcache::test::make_peer_id(0x21);
    const auto neighbour_id = meshcache::test::make_peer_id(0x22);

    meshcache::Config config;
    config.store_capacity_bytes = 40'000;
    meshcache::test::MeshNode publisher(mesh, publisher_id, config);
    meshcache::test::MeshNode neighbour(mesh, neighbour_id, meshcache::Config{});
    publisher.router.add_neighbour(neighbour_id);

    const auto payload = meshcache::test::make_payload(20'000, 0x01);
    const auto manifest = publisher.coordinator.publish(payload, "pinned.bin");
    assert(manifest.chunks.size() == 2);
    assert(manifest.chunks[0] != manifest.chunks[1]);
    for (const auto& id : manifest.chunks) {
        assert(publisher.ledger.is_pinned(id));
    }

    // Nobody answers the offers; they expire and are swept.
    publisher.advance(publisher.config.offer_ttl + 1s);
    const auto expired = publisher.coordinator.tick(publisher.clock);
    assert(expired.expired == 2);
    publisher.advance(publisher.config.ledger_resolved_grace + 1s);
    publisher.coordinator.tick(publisher.clock);
    for (const auto& id : manifest.chunks) {
        assert(!publisher.ledger.is_pinned(id));
        assert(!publisher.ledger.find(id, meshcache::RequestKind::Offer).has_value());
        assert(publisher.coordinator.is_retained(id));
    }

    const auto far = meshcache::test::make_payload(10'000, 0x0A);
    const auto far_id = meshcache::crypto::identify(far);
    assert(publisher.coordinator.on_chunk_observed(far_id, far, 5, publisher.clock) ==
           meshcache::ReceiveOutcome::Retained);

    // Above high water: the only evictable resident is the distant one.
    const auto near = meshcache::test::make_payload(10'000, 0x0B);
    const auto near_id = meshcache::crypto::identify(near);
    assert(publisher.coordinator.on_chunk_observed(near_id, near, 1, publisher.clock) ==
           meshcache::ReceiveOutcome::Retained);

    assert(!publisher.store.has(far_id));
    assert(publisher.store.has(near_id));
    for (const auto& id : manifest.chunks) {
        assert(publisher.store.has(id));
    }
    assert(publisher.coordinator.is_complete(manifest.manifest_id));
    assert(!publisher.coordinator.is_retained(near_id));
}

}  // namespace

int main() {
    meshcache::test::silence_logs();

    served_chunks_survive_local_fetch();
    published_chunks_outlive_their_offers();
    return 0;
}
