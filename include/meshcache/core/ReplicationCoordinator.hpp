#pragma once

#include "meshcache/Config.hpp"
#include "meshcache/Error.hpp"
#include "meshcache/Export.hpp"
#include "meshcache/Types.hpp"
#include "meshcache/core/CacheAdmission.hpp"
#include "meshcache/core/RequestLedger.hpp"
#include "meshcache/network/Transport.hpp"
#include "meshcache/protocol/Manifest.hpp"
#include "meshcache/storage/ChunkStore.hpp"
#include "meshcache/storage/ManifestIndex.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace meshcache {

namespace test {
class CoordinatorTestAccess;
}

using RequestHandle = std::uint64_t;

enum class ReceiveOutcome : std::uint8_t {
    Retained,
    Standby,
    NotRetained,
    Duplicate,
    Rejected
};

struct ChunkProgress {
    ChunkId id{};
    bool present{false};
    std::optional<RequestState> state;
    std::uint32_t attempts{0};
};

struct StatusSnapshot {
    RequestHandle handle{0};
    ChunkId target{};
    bool is_manifest{false};
    RequestState state{RequestState::Pending};
    std::size_t total_chunks{0};
    std::size_t resolved_chunks{0};
    std::optional<ErrorCode> error;
    std::vector<ChunkProgress> chunks;
};

struct ForgetReport {
    std::size_t chunks_removed{0};
    // Still referenced by another manifest.
    std::size_t chunks_shared{0};
    // Left in place while a fetch for them is pending.
    std::size_t chunks_in_flight{0};
};

struct TickReport {
    std::size_t expired{0};
    std::size_t retried{0};
    std::size_t failed{0};
    std::size_t swept{0};
    std::size_t standby_admitted{0};
    std::size_t handles_pruned{0};
    std::size_t sources_pruned{0};
};

class CoordinatorListener {
public:
    virtual ~CoordinatorListener() = default;

    virtual void on_chunk_resolved(RequestHandle, const ChunkId&) {}
    virtual void on_request_failed(RequestHandle, const ChunkId&, ErrorCode) {}
    virtual void on_store_changed(const StoreChange&) {}
    virtual void on_file_complete(RequestHandle, const ChunkId&) {}
};

// Decides whether an offered chunk is wanted without an explicit fetch.
using InterestFilter = std::function<bool(const ChunkId& id, std::uint32_t size, HopCount hop_distance)>;
using SteadyClockFn = std::function<std::chrono::steady_clock::time_point()>;

/**
 * Per-node replication engine.
 *
 * Turns fetch/publish intents into ledger entries and transport sends, and
 * transport events into verified store writes, admission decisions and
 * subscriber fan-out. Handlers are serialized on one scheduler mutex; the
 * store and ledger lock internally. Chunks a local caller asked for are
 * always kept, relayed or observed chunks go through CacheAdmission and land
 * in the standby queue when declined.
 */
class MESHCACHE_API ReplicationCoordinator : public network::InboundHandler {
public:
    // Finished handles stay queryable through status() until this many newer ones finish.
    static constexpr std::size_t kRetainedFinishedHandles = 256;
    // Chunks with remembered providers; tick() trims down to this.
    static constexpr std::size_t kKnownSourceChunkLimit = 1024;

    ReplicationCoordinator(PeerId self_id,
                           const Config& config,
                           ChunkStore& store,
                           RequestLedger& ledger,
                           const CacheAdmission& admission,
                           ManifestResolver& resolver,
                           network::Transport& transport,
                           const network::PeerRouter& router,
                           CoordinatorListener* listener = nullptr);
    ~ReplicationCoordinator() override;

    ReplicationCoordinator(const ReplicationCoordinator&) = delete;
    ReplicationCoordinator& operator=(const ReplicationCoordinator&) = delete;

    RequestHandle fetch(const ChunkId& target);
    RequestHandle fetch(const ChunkId& target, std::chrono::steady_clock::time_point now);
    protocol::FileManifest publish(std::span<const std::uint8_t> payload,
                                   const std::string& name,
                                   std::map<std::string, std::string> metadata = {});
    protocol::FileManifest publish(std::span<const std::uint8_t> payload,
                                   const std::string& name,
                                   std::map<std::string, std::string> metadata,
                                   std::chrono::steady_clock::time_point now);

    std::optional<StatusSnapshot> status(RequestHandle handle) const;
    StatusSnapshot status_of(const ChunkId& id) const;
    bool cancel(RequestHandle handle);

    ReceiveOutcome on_chunk_received(const ChunkId& id,
                                     std::span<const std::uint8_t> payload,
                                     const PeerId& from,
                                     HopCount hop_distance,
                                     std::chrono::steady_clock::time_point now);
    ReceiveOutcome on_chunk_observed(const ChunkId& id,
                                     std::span<const std::uint8_t> payload,
                                     HopCount hop_distance,
                                     std::chrono::steady_clock::time_point now);
    void on_offer_received(const ChunkId& id,
                           const PeerId& from,
                           HopCount hop_distance,
                           std::uint32_t size,
                           std::chrono::steady_clock::time_point now);
    void on_chunk_request_from_peer(const ChunkId& id, const PeerId& from, std::chrono::steady_clock::time_point now);
    void on_miss(const ChunkId& id, const PeerId& from, std::chrono::steady_clock::time_point now);
    void on_send_failure(const ChunkId& id, const PeerId& peer, std::chrono::steady_clock::time_point now);

    void subscribe(const protocol::FileManifest& manifest);
    // Drops the manifest and every chunk no other manifest still references.
    std::optional<ForgetReport> forget_manifest(const ChunkId& manifest_id);
    void set_interest_filter(InterestFilter filter);
    [[nodiscard]] bool is_complete(const ChunkId& manifest_id) const;
    // Published, subscribed or held by a pending ledger entry; never evicted.
    [[nodiscard]] bool is_retained(const ChunkId& id) const;

    TickReport tick(std::chrono::steady_clock::time_point now);

    void set_listener(CoordinatorListener* listener);
    void set_clock(SteadyClockFn clock);
    std::size_t standby_size() const;

    const PeerId& id() const noexcept {
        return self_id_;
    }

    void handle_offer(const ChunkId& id, const PeerId& from, HopCount hop_distance, std::uint32_t size) override;
    void handle_chunk(const ChunkId& id,
                      std::span<const std::uint8_t> payload,
                      const PeerId& from,
                      HopCount hop_distance) override;
    void handle_request(const ChunkId& id, const PeerId& from) override;
    void handle_miss(const ChunkId& id, const PeerId& from) override;

private:
    friend class test::CoordinatorTestAccess;

    enum class DispatchResult {
        Sent,
        NoSource,
        Refused
    };

    struct HandleState {
        ChunkId target{};
        std::optional<ChunkId> manifest_id;
        std::vector<ChunkId> chunks;
        std::unordered_set<std::string> outstanding;
        std::optional<ErrorCode> error;
        bool complete_notified{false};
    };

    struct StandbyEntry {
        ChunkId id{};
        ChunkData payload;
        HopCount hop_distance{kUnknownHops};
        double score{0.0};
    };

    PeerId self_id_;
    Config config_;
    ChunkStore& store_;
    RequestLedger& ledger_;
    const CacheAdmission& admission_;
    ManifestResolver& resolver_;
    network::Transport& transport_;
    const network::PeerRouter& router_;
    CoordinatorListener* listener_{nullptr};
    SteadyClockFn clock_;

    RequestHandle next_handle_{1};
    RequestHandle interest_handle_{0};
    std::unordered_map<RequestHandle, HandleState> handles_;
    std::unordered_map<std::string, std::vector<PeerId>> known_sources_;
    // Chunk key -> number of subscribed manifests that contain it.
    std::unordered_map<std::string, std::size_t> desired_chunks_;
    std::unordered_set<std::string> subscribed_manifests_;
    std::unordered_set<std::string> published_chunks_;
    std::deque<RequestHandle> finished_handles_;
    InterestFilter interest_filter_;
    std::vector<StandbyEntry> standby_;
    std::atomic<bool> standby_dirty_{false};

    mutable std::recursive_mutex scheduler_mutex_;

    std::chrono::steady_clock::time_point now() const;

    void seed_sources_locked(const ChunkId& id);
    void remember_source_locked(const ChunkId& id, const PeerId& peer);
    void forget_source_locked(const ChunkId& id, const PeerId& peer);
    DispatchResult send_to_next_source_locked(const ChunkId& id, std::chrono::steady_clock::time_point now);
    bool dispatch_fetch_locked(const ChunkId& id, std::chrono::steady_clock::time_point now);
    void handle_failure_locked(const FailureOutcome& outcome);
    void reply_miss_locked(const ChunkId& id, const PeerId& peer);

    bool desired_locally_locked(const ChunkId& id, std::uint32_t size, HopCount hop_distance) const;
    bool retained_locally_locked(const ChunkId& id) const;
    std::vector<ChunkId> plan_evictions_locked(std::uint64_t bytes_to_free, const PinPredicate& pinned) const;
    bool make_room_locked(std::size_t size, const PinPredicate& pinned);
    ReceiveOutcome admit_locked(const ChunkId& id,
                                std::span<const std::uint8_t> payload,
                                HopCount hop_distance,
                                bool keep,
                                std::uint64_t demand);
    void park_standby_locked(const ChunkId& id,
                             std::span<const std::uint8_t> payload,
                             HopCount hop_distance,
                             std::uint64_t demand);
    std::size_t drain_standby_locked();

    void resolve_handle_locked(RequestHandle handle, const ChunkId& id);
    void fail_handle_locked(RequestHandle handle, const ChunkId& id, ErrorCode code);
    void mark_finished_locked(RequestHandle handle);
    std::size_t prune_handles_locked();
    std::size_t prune_sources_locked();
    void on_store_changed(const StoreChange& change);
};

}  // namespace meshcache
