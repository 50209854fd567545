#include "meshcache/Error.hpp"
#include "meshcache/crypto/Sha256.hpp"
#include "meshcache/storage/ChunkStore.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

std::filesystem::path scratch_directory(const std::string& name) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(stamp));
    std::filesystem::remove_all(path);
    return path;
}

void memory_store_roundtrip() {
    meshcache::Config config{};
    config.store_capacity_bytes = 4096;
    config.max_chunk_bytes = 2048;
    meshcache::ChunkStore store(config);

    const auto payload = meshcache::test::make_payload(1000, 0x11);
    const auto id = store.put(payload, 2);
    assert(id == meshcache::crypto::identify(payload));
    assert(store.has(id));

    // Storing identical content again is a no-op.
    assert(store.put(payload, 7) == id);
    assert(store.chunk_count() == 1);
    assert(store.used_bytes() == 1000);
    assert(store.metadata(id)->hop_distance == 2);

    const auto chunk = store.get(id);
    assert(chunk.has_value());
    assert(chunk->payload == payload);
    assert(store.metadata(id)->access_count == 1);

    // Wrong expected digest is refused and nothing is written.
    const auto other = meshcache::test::make_payload(64, 0x22);
    bool integrity_raised = false;
    try {
        store.put_verified(id, other);
    } catch (const meshcache::Error& error) {
        integrity_raised = error.code() == meshcache::ErrorCode::Integrity;
    }
    assert(integrity_raised);
    assert(store.chunk_count() == 1);

    // Oversized chunk and exhausted capacity both surface as Capacity.
    bool oversize_raised = false;
    try {
        store.put(meshcache::test::make_payload(3000, 0x33));
    } catch (const meshcache::Error& error) {
        oversize_raised = error.code() == meshcache::ErrorCode::Capacity;
    }
    assert(oversize_raised);

    store.put(meshcache::test::make_payload(2000, 0x44));
    assert(store.used_bytes() == 3000);
    bool full_raised = false;
    try {
        store.put(meshcache::test::make_payload(2000, 0x55));
    } catch (const meshcache::Error& error) {
        full_raised = error.code() == meshcache::ErrorCode::Capacity;
    }
    assert(full_raised);
    assert(store.used_bytes() == 3000);
    assert(store.utilization() > 0.7 && store.utilization() < 0.75);

    assert(store.remove(id));
    assert(!store.has(id));
    assert(!store.remove(id));
    assert(!store.get(id).has_value());
}

void access_order_follows_reads() {
    meshcache::ChunkStore store{};
    const auto first = store.put(meshcache::test::make_payload(10, 0x01));
    const auto second = store.put(meshcache::test::make_payload(10, 0x02));
    const auto third = store.put(meshcache::test::make_payload(10, 0x03));

    assert(store.get(first).has_value());

    const auto order = store.list_by_access_order();
    assert(order.size() == 3);
    assert(order[0].id == second);
    assert(order[1].id == third);
    assert(order[2].id == first);

    const auto page = store.list_by_access_order(1, 1);
    assert(page.size() == 1);
    assert(page[0].id == third);
}

void corrupted_payload_is_purged() {
    const auto directory = scratch_directory("meshcache_integrity");

    meshcache::Config config{};
    config.storage_persistent_enabled = true;
    config.storage_directory = directory.string();

    std::size_t removed_events = 0;
    meshcache::ChunkStore store(config);
    store.set_observer([&](const meshcache::StoreChange& change) {
        if (change.kind == meshcache::StoreChange::Kind::Removed) {
            ++removed_events;
        }
    });

    const auto payload = meshcache::test::make_payload(512, 0x5A);
    const auto id = store.put(payload, 1);
    const auto path = store.payload_path(id);
    assert(std::filesystem::exists(path));

    {
        std::ofstream tamper(path, std::ios::binary | std::ios::trunc);
        const std::string garbage(512, 'x');
        tamper.write(garbage.data(), static_cast<std::streamsize>(garbage.size()));
    }

    assert(!store.get(id).has_value());
    assert(!store.has(id));
    assert(!std::filesystem::exists(path));
    assert(store.used_bytes() == 0);
    assert(removed_events == 1);

    // verify_all finds corruption without a read request.
    const auto kept = store.put(meshcache::test::make_payload(256, 0x6B));
    const auto damaged = store.put(meshcache::test::make_payload(256, 0x7C));
    {
        std::ofstream tamper(store.payload_path(damaged), std::ios::binary | std::ios::trunc);
        tamper << "short";
    }
    const auto purged = store.verify_all();
    assert(purged.size() == 1);
    assert(purged.front() == damaged);
    assert(store.has(kept));

    std::filesystem::remove_all(directory);
}

void inventory_digest_tracks_contents() {
    meshcache::ChunkStore left{};
    meshcache::ChunkStore right{};
    const auto a = meshcache::test::make_payload(32, 0x0A);
    const auto b = meshcache::test::make_payload(32, 0x0B);

    left.put(a);
    left.put(b);
    right.put(b);
    assert(left.inventory_digest() != right.inventory_digest());

    right.put(a);
    assert(left.inventory_digest() == right.inventory_digest());
}

}  // namespace

int main() {
    meshcache::test::silence_logs();

    memory_store_roundtrip();
    access_order_follows_reads();
    corrupted_payload_is_purged();
    inventory_digest_tracks_contents();
    return 0;
}
