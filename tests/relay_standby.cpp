#include "meshcache/crypto/Sha256.hpp"
#include "meshcache/network/LoopbackMesh.hpp"
#include "test_access.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>

using namespace std::chrono_literals;
using meshcache::protocol::MessageType;

int main() {
    meshcache::test::silence_logs();

    meshcache::network::LoopbackMesh mesh;
    const auto origin_id = meshcache::test::make_peer_id(0x01);
    const auto relay_id = meshcache::test::make_peer_id(0x02);
    const auto edge_id = meshcache::test::make_peer_id(0x03);

    meshcache::Config relay_config{};
    relay_config.store_capacity_bytes = 1000;
    relay_config.admission_high_water = 0.5;
    relay_config.standby_queue_limit = 2;

    meshcache::test::MeshNode origin(mesh, origin_id, meshcache::Config{});
    meshcache::test::MeshNode relay(mesh, relay_id, relay_config);
    meshcache::test::MeshNode edge(mesh, edge_id, meshcache::Config{});

    origin.router.add_neighbour(relay_id);
    relay.router.add_neighbour(origin_id);
    relay.router.add_neighbour(edge_id);
    edge.router.add_neighbour(relay_id);

    // A popular resident makes the relay reluctant to take anything else.
    const auto favourite = relay.store.put(meshcache::test::make_payload(400, 0x10), 0);
    for (int read = 0; read < 32; ++read) {
        assert(relay.store.get(favourite).has_value());
    }

    const auto wanted_payload = meshcache::test::make_payload(300, 0x20);
    const auto wanted = origin.store.put(wanted_payload, 0);

    const auto handle = edge.coordinator.fetch(wanted);
    mesh.pump();

    // The edge got its chunk through the relay even though the relay declined to keep it.
    assert(edge.store.has(wanted));
    assert(edge.store.metadata(wanted)->hop_distance == 2);
    assert(edge.coordinator.status(handle)->state == meshcache::RequestState::Resolved);
    assert(mesh.addressed_to(origin_id, MessageType::Request) == 1);
    assert(!relay.store.has(wanted));
    assert(relay.store.has(favourite));
    assert(relay.coordinator.standby_size() == 1);
    const auto parked = meshcache::test::CoordinatorTestAccess::standby_ids(relay.coordinator);
    assert(parked.size() == 1 && parked.front() == wanted);

    // A second relay request is forwarded again since the relay holds no copy.
    const auto second_payload = meshcache::test::make_payload(300, 0x30);
    const auto second = origin.store.put(second_payload, 0);
    edge.coordinator.fetch(second);
    mesh.pump();
    assert(edge.store.has(second));
    assert(relay.coordinator.standby_size() == 2);

    // With the queue full, a third declined chunk displaces the weakest entry or is dropped.
    const auto third = meshcache::crypto::identify(meshcache::test::make_payload(300, 0x40));
    relay.coordinator.on_chunk_observed(third, meshcache::test::make_payload(300, 0x40), 5, relay.clock);
    assert(relay.coordinator.standby_size() == 2);

    // Freeing space lets the standby queue drain on the next tick.
    assert(relay.store.remove(favourite));
    const auto report = relay.coordinator.tick(relay.clock);
    assert(report.standby_admitted >= 1);
    assert(relay.coordinator.standby_size() + report.standby_admitted == 2);
    const auto now_stored = static_cast<std::size_t>(relay.store.has(wanted)) +
                            static_cast<std::size_t>(relay.store.has(second)) +
                            static_cast<std::size_t>(relay.store.has(third));
    assert(now_stored == report.standby_admitted);
    assert(relay.store.used_bytes() <= relay.store.capacity_bytes());

    // Once cached, the relay answers the edge without going back to the origin.
    const auto cached = relay.store.has(wanted) ? wanted : (relay.store.has(second) ? second : third);
    const auto requests_before = mesh.addressed_to(origin_id, MessageType::Request);
    edge.store.remove(cached);
    edge.advance(edge.config.ledger_resolved_grace + 1s);
    edge.coordinator.tick(edge.clock);
    edge.coordinator.fetch(cached);
    mesh.pump();
    assert(edge.store.has(cached));
    assert(mesh.addressed_to(origin_id, MessageType::Request) == requests_before);

    // With relaying off, an unknown chunk is answered with a miss.
    meshcache::Config closed_config{};
    closed_config.relay_enabled = false;
    const auto closed_id = meshcache::test::make_peer_id(0x04);
    meshcache::test::MeshNode closed(mesh, closed_id, closed_config);
    closed.router.add_neighbour(origin_id);
    const auto misses_before = mesh.addressed_to(edge_id, MessageType::Miss);
    closed.coordinator.on_chunk_request_from_peer(
        meshcache::crypto::identify(meshcache::test::make_payload(10, 0x50)), edge_id, closed.clock);
    assert(mesh.addressed_to(edge_id, MessageType::Miss) == misses_before + 1);
    assert(mesh.addressed_to(origin_id, MessageType::Request) == requests_before);
    return 0;
}
