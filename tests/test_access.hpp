#pragma once

#include "meshcache/core/CacheAdmission.hpp"
#include "meshcache/core/ReplicationCoordinator.hpp"
#include "meshcache/core/RequestLedger.hpp"
#include "meshcache/log/StructuredLogger.hpp"
#include "meshcache/network/LoopbackMesh.hpp"
#include "meshcache/network/StaticPeerRouter.hpp"
#include "meshcache/storage/ChunkStore.hpp"
#include "meshcache/storage/ManifestIndex.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace meshcache::test {

class CoordinatorTestAccess {
public:
    static std::vector<ChunkId> standby_ids(const ReplicationCoordinator& coordinator) {
        std::scoped_lock lock(coordinator.scheduler_mutex_);
        std::vector<ChunkId> ids;
        ids.reserve(coordinator.standby_.size());
        for (const auto& entry : coordinator.standby_) {
            ids.push_back(entry.id);
        }
        return ids;
    }

    static std::vector<PeerId> known_sources(const ReplicationCoordinator& coordinator, const ChunkId& id) {
        std::scoped_lock lock(coordinator.scheduler_mutex_);
        const auto it = coordinator.known_sources_.find(chunk_id_to_string(id));
        if (it == coordinator.known_sources_.end()) {
            return {};
        }
        return it->second;
    }

    static bool desires(const ReplicationCoordinator& coordinator, const ChunkId& id) {
        std::scoped_lock lock(coordinator.scheduler_mutex_);
        return coordinator.desired_chunks_.count(chunk_id_to_string(id)) > 0;
    }

    static std::size_t open_handles(const ReplicationCoordinator& coordinator) {
        std::scoped_lock lock(coordinator.scheduler_mutex_);
        return coordinator.handles_.size();
    }

    static std::size_t known_source_chunks(const ReplicationCoordinator& coordinator) {
        std::scoped_lock lock(coordinator.scheduler_mutex_);
        return coordinator.known_sources_.size();
    }

    static RequestHandle interest_handle(const ReplicationCoordinator& coordinator) {
        return coordinator.interest_handle_;
    }
};

inline void silence_logs() {
    log::StructuredLogger::instance().set_enabled(false);
}

inline PeerId make_peer_id(std::uint8_t seed) {
    PeerId id{};
    for (auto& byte : id) {
        byte = seed++;
    }
    return id;
}

inline std::vector<std::uint8_t> make_payload(std::size_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> payload(size);
    for (std::size_t i = 0; i < size; ++i) {
        payload[i] = static_cast<std::uint8_t>(seed + i * 31);
    }
    return payload;
}

struct RecordingListener : CoordinatorListener {
    std::vector<std::pair<RequestHandle, ChunkId>> resolved;
    std::vector<std::pair<RequestHandle, ErrorCode>> failed;
    std::vector<RequestHandle> completed;

    void on_chunk_resolved(RequestHandle handle, const ChunkId& id) override {
        resolved.emplace_back(handle, id);
    }
    void on_request_failed(RequestHandle handle, const ChunkId&, ErrorCode code) override {
        failed.emplace_back(handle, code);
    }
    void on_file_complete(RequestHandle handle, const ChunkId&) override {
        completed.push_back(handle);
    }
};

// One node wired into a LoopbackMesh, driven by a manual clock.
struct MeshNode {
    MeshNode(network::LoopbackMesh& mesh, PeerId id, Config node_config)
        : peer(id),
          config(std::move(node_config)),
          store(config),
          ledger(config),
          admission(config),
          manifests(config),
          coordinator(peer, config, store, ledger, admission, manifests, mesh.attach(peer), router, &listener) {
        mesh.attach(peer).set_handler(&coordinator);
        coordinator.set_clock([this] { return clock; });
    }

    void advance(std::chrono::steady_clock::duration step) {
        clock += step;
    }

    PeerId peer;
    Config config;
    std::chrono::steady_clock::time_point clock{std::chrono::steady_clock::time_point{} + std::chrono::hours(1)};
    ChunkStore store;
    RequestLedger ledger;
    CacheAdmission admission;
    ManifestIndex manifests;
    network::StaticPeerRouter router;
    RecordingListener listener;
    ReplicationCoordinator coordinator;
};

}  // namespace meshcache::test
