#pragma once

#include "meshcache/Config.hpp"
#include "meshcache/Export.hpp"
#include "meshcache/Types.hpp"
#include "meshcache/crypto/Sha256.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

struct sqlite3;

namespace meshcache {

struct ChunkMetadata {
    ChunkId id{};
    std::size_t size{0};
    std::chrono::system_clock::time_point created_at{};
    std::chrono::system_clock::time_point last_access{};
    HopCount hop_distance{kUnknownHops};
    std::uint64_t access_count{0};
};

struct StoreChange {
    enum class Kind {
        Added,
        Removed
    };

    Kind kind{Kind::Added};
    ChunkId id{};
    std::size_t size{0};
};

using StoreObserver = std::function<void(const StoreChange&)>;

/**
 * Content-addressed chunk storage.
 *
 * The index lives in SQLite (index.sqlite3, or an in-memory database when
 * persistence is disabled) and orders chunks by an access sequence so that
 * least-recently-used scans never walk the whole table. Payloads of a
 * persistent store are kept as one file per chunk under <storage>/chunks and
 * are written through a temporary file, so a failed write leaves the chunk
 * absent. Every read re-derives the digest; a mismatch purges the entry.
 */
class MESHCACHE_API ChunkStore {
public:
    struct ReconcileReport {
        std::size_t orphan_files_removed{0};
        std::size_t missing_payloads_dropped{0};
    };

    explicit ChunkStore(Config config = {});
    ~ChunkStore();

    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    ChunkId put(std::span<const std::uint8_t> payload, HopCount hop_distance = kUnknownHops);
    // Throws Error{Integrity} and stores nothing when the payload does not hash to expected.
    ChunkId put_verified(const ChunkId& expected,
                         std::span<const std::uint8_t> payload,
                         HopCount hop_distance = kUnknownHops);
    std::optional<Chunk> get(const ChunkId& id);
    [[nodiscard]] bool has(const ChunkId& id) const;
    bool remove(const ChunkId& id);
    std::optional<ChunkMetadata> metadata(const ChunkId& id) const;

    // Least recently used first. limit == 0 returns every row.
    std::vector<ChunkMetadata> list_by_access_order(std::size_t limit = 0, std::size_t offset = 0) const;

    std::size_t chunk_count() const;
    std::uint64_t used_bytes() const;
    std::uint64_t capacity_bytes() const noexcept;
    double utilization() const;
    crypto::Sha256::Digest inventory_digest() const;

    ReconcileReport reconcile();
    std::vector<ChunkId> verify_all();

    void set_observer(StoreObserver observer);

    const std::filesystem::path& storage_root() const noexcept {
        return storage_root_;
    }

    std::filesystem::path payload_path(const ChunkId& id) const;

private:
    Config config_;
    bool persistent_enabled_{false};
    std::filesystem::path storage_root_;
    std::filesystem::path chunk_root_;
    sqlite3* db_{nullptr};
    std::uint64_t used_bytes_{0};
    std::int64_t access_sequence_{0};
    StoreObserver observer_{};
    mutable std::mutex mutex_;

    void open_index();
    void load_counters();
    bool ensure_storage_directory();
    bool row_exists_locked(const std::string& key) const;
    std::optional<ChunkMetadata> read_metadata_locked(const std::string& key) const;
    std::optional<ChunkData> read_payload_locked(const std::string& key) const;
    void write_payload_locked(const std::string& key, std::span<const std::uint8_t> payload);
    void erase_locked(const std::string& key, std::size_t size);
    void touch_locked(const std::string& key);
    ChunkId insert_locked(const ChunkId& id, std::span<const std::uint8_t> payload, HopCount hop_distance,
                          std::vector<StoreChange>& changes);
    void notify(const std::vector<StoreChange>& changes) const;
};

}  // namespace meshcache
