#include "meshcache/crypto/Sha256.hpp"
#include "meshcache/network/LoopbackMesh.hpp"
#include "meshcache/protocol/Manifest.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>

using meshcache::protocol::MessageType;

namespace {

meshcache::Config small_chunks() {
    meshcache::Config config{};
    config.chunk_size = 1024;
    return config;
}

}  // namespace

int main() {
    meshcache::test::silence_logs();

    meshcache::network::LoopbackMesh mesh;
    const auto publisher_id = meshcache::test::make_peer_id(0x01);
    const auto explicit_id = meshcache::test::make_peer_id(0x40);
    const auto subscriber_id = meshcache::test::make_peer_id(0x90);

    meshcache::test::MeshNode publisher(mesh, publisher_id, small_chunks());
    meshcache::test::MeshNode explicit_fetcher(mesh, explicit_id, small_chunks());
    meshcache::test::MeshNode subscriber(mesh, subscriber_id, small_chunks());

    publisher.router.add_neighbour(explicit_id);
    publisher.router.add_neighbour(subscriber_id);
    explicit_fetcher.router.add_neighbour(publisher_id);
    subscriber.router.add_neighbour(publisher_id);

    // A file whose first and last chunks repeat.
    auto payload = meshcache::test::make_payload(1024, 0x11);
    const auto middle = meshcache::test::make_payload(1024, 0x22);
    payload.insert(payload.end(), middle.begin(), middle.end());
    const auto tail = meshcache::test::make_payload(1024, 0x11);
    payload.insert(payload.end(), tail.begin(), tail.end());

    // Precompute the manifest the publisher will produce so the subscriber can wait for it.
    meshcache::protocol::FileManifest expected{};
    expected.name = "notes.txt";
    expected.total_size = payload.size();
    expected.chunk_size = 1024;
    for (const auto piece : meshcache::protocol::split_payload(payload, 1024)) {
        expected.chunks.push_back(meshcache::crypto::identify(piece));
    }
    meshcache::protocol::seal_manifest(expected);
    subscriber.coordinator.subscribe(expected);
    assert(!subscriber.coordinator.is_complete(expected.manifest_id));

    const auto manifest = publisher.coordinator.publish(payload, "notes.txt", {{"origin", "test"}});
    assert(manifest.manifest_id == expected.manifest_id);
    assert(manifest.chunks.size() == 3);
    assert(manifest.chunks.front() == manifest.chunks.back());
    assert(publisher.store.chunk_count() == 2);
    assert(publisher.store.metadata(manifest.chunks[1])->hop_distance == 0);
    assert(publisher.coordinator.is_complete(manifest.manifest_id));
    assert(publisher.manifests.find(manifest.manifest_id).has_value());

    // One offer per distinct chunk and neighbour.
    assert(mesh.addressed_to(explicit_id, MessageType::Offer) == 2);
    assert(mesh.addressed_to(subscriber_id, MessageType::Offer) == 2);
    assert(publisher.ledger.pending_count(meshcache::RequestKind::Offer) == 2);

    mesh.pump();

    // The subscriber pulled every chunk from the offers alone; the other node only listened.
    assert(subscriber.coordinator.is_complete(manifest.manifest_id));
    assert(mesh.addressed_to(publisher_id, MessageType::Request) == 2);
    assert(explicit_fetcher.store.chunk_count() == 0);
    assert(!explicit_fetcher.coordinator.is_complete(manifest.manifest_id));

    // The other node learns the manifest from its URI and fetches the whole file.
    const auto uri = meshcache::protocol::manifest_to_uri(manifest);
    const auto received = meshcache::protocol::manifest_from_uri(uri);
    explicit_fetcher.coordinator.subscribe(received);
    const auto handle = explicit_fetcher.coordinator.fetch(received.manifest_id);

    const auto pending = explicit_fetcher.coordinator.status(handle);
    assert(pending.has_value());
    assert(pending->is_manifest);
    assert(pending->total_chunks == 2);
    assert(pending->resolved_chunks == 0);
    assert(pending->state == meshcache::RequestState::Pending);

    mesh.pump();

    assert(explicit_fetcher.coordinator.is_complete(manifest.manifest_id));
    const auto done = explicit_fetcher.coordinator.status(handle);
    assert(done->state == meshcache::RequestState::Resolved);
    assert(done->resolved_chunks == 2);
    assert(explicit_fetcher.listener.completed.size() == 1);
    assert(explicit_fetcher.listener.completed.front() == handle);

    // Losing one chunk makes the manifest incomplete again.
    explicit_fetcher.store.remove(manifest.chunks[1]);
    assert(!explicit_fetcher.coordinator.is_complete(manifest.manifest_id));

    // Serving both peers settled the publisher's offers.
    assert(publisher.ledger.pending_count(meshcache::RequestKind::Offer) == 0);
    return 0;
}
