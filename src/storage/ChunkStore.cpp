#include "meshcache/storage/ChunkStore.hpp"

#include "meshcache/Error.hpp"
#include "meshcache/log/StructuredLogger.hpp"
#include "SqliteSupport.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <utility>

namespace meshcache {

namespace {

using detail_statement = storage::detail::Statement;
using storage::detail::from_unix_micros;
using storage::detail::to_unix_micros;

constexpr char kChunkExtension[] = ".chunk";
constexpr char kTempExtension[] = ".tmp";

constexpr char kSchema[] =
    "CREATE TABLE IF NOT EXISTS chunks ("
    " id TEXT PRIMARY KEY,"
    " size INTEGER NOT NULL,"
    " created_at INTEGER NOT NULL,"
    " last_access INTEGER NOT NULL,"
    " access_seq INTEGER NOT NULL,"
    " hop_distance INTEGER NOT NULL,"
    " access_count INTEGER NOT NULL DEFAULT 0,"
    " payload BLOB"
    ");"
    "CREATE INDEX IF NOT EXISTS chunks_access_order ON chunks(access_seq);";

ChunkMetadata metadata_from_row(const detail_statement& row) {
    ChunkMetadata meta{};
    if (const auto id = chunk_id_from_string(row.column_text(0))) {
        meta.id = *id;
    }
    meta.size = static_cast<std::size_t>(row.column_int(1));
    meta.created_at = from_unix_micros(row.column_int(2));
    meta.last_access = from_unix_micros(row.column_int(3));
    meta.hop_distance = static_cast<HopCount>(std::clamp<std::int64_t>(row.column_int(4), 0, kUnknownHops));
    meta.access_count = static_cast<std::uint64_t>(row.column_int(5));
    return meta;
}

}  // namespace

ChunkStore::ChunkStore(Config config)
    : config_(std::move(config)),
      persistent_enabled_(config_.storage_persistent_enabled) {
    if (persistent_enabled_) {
        storage_root_ = std::filesystem::path(config_.storage_directory.empty() ? "storage" : config_.storage_directory);
        chunk_root_ = storage_root_ / "chunks";
        if (!ensure_storage_directory()) {
            log::log_event(log::StructuredLogger::Level::Warning,
                           "store.fallback_memory",
                           {{"directory", storage_root_.string()}});
            persistent_enabled_ = false;
            storage_root_.clear();
            chunk_root_.clear();
        }
    }

    open_index();
    load_counters();

    if (persistent_enabled_) {
        const auto report = reconcile();
        if (report.orphan_files_removed > 0 || report.missing_payloads_dropped > 0) {
            log::log_event(log::StructuredLogger::Level::Info,
                           "store.reconciled",
                           {{"orphans", std::to_string(report.orphan_files_removed)},
                            {"dropped", std::to_string(report.missing_payloads_dropped)}});
        }
    }
}

ChunkStore::~ChunkStore() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ChunkStore::open_index() {
    const auto path = persistent_enabled_ ? (storage_root_ / "index.sqlite3").string() : std::string(":memory:");
    db_ = storage::detail::open_database(path);
    storage::detail::exec(db_, kSchema);
    if (persistent_enabled_) {
        storage::detail::exec(db_, "PRAGMA journal_mode=WAL;");
        storage::detail::exec(db_, "PRAGMA synchronous=NORMAL;");
    }
}

void ChunkStore::load_counters() {
    std::scoped_lock lock(mutex_);
    detail_statement stmt(db_, "SELECT COALESCE(SUM(size), 0), COALESCE(MAX(access_seq), 0) FROM chunks;");
    if (stmt.step()) {
        used_bytes_ = static_cast<std::uint64_t>(stmt.column_int(0));
        access_sequence_ = stmt.column_int(1);
    }
}

bool ChunkStore::ensure_storage_directory() {
    std::error_code ec;
    if (std::filesystem::exists(chunk_root_, ec)) {
        return std::filesystem::is_directory(chunk_root_, ec);
    }
    std::filesystem::create_directories(chunk_root_, ec);
    return !ec && std::filesystem::is_directory(chunk_root_, ec);
}

std::filesystem::path ChunkStore::payload_path(const ChunkId& id) const {
    if (!persistent_enabled_) {
        return {};
    }
    return chunk_root_ / (chunk_id_to_string(id) + kChunkExtension);
}

ChunkId ChunkStore::put(std::span<const std::uint8_t> payload, HopCount hop_distance) {
    const auto id = crypto::identify(payload);
    std::vector<StoreChange> changes;
    {
        std::scoped_lock lock(mutex_);
        insert_locked(id, payload, hop_distance, changes);
    }
    notify(changes);
    return id;
}

ChunkId ChunkStore::put_verified(const ChunkId& expected,
                                 std::span<const std::uint8_t> payload,
                                 HopCount hop_distance) {
    const auto actual = crypto::identify(payload);
    if (actual != expected) {
        log::log_event(log::StructuredLogger::Level::Warning,
                       "store.integrity",
                       {{"expected", short_id(expected)}, {"actual", short_id(actual)}});
        throw_error(ErrorCode::Integrity,
                    "payload digest " + short_id(actual) + " does not match " + short_id(expected));
    }

    std::vector<StoreChange> changes;
    {
        std::scoped_lock lock(mutex_);
        insert_locked(actual, payload, hop_distance, changes);
    }
    notify(changes);
    return actual;
}

ChunkId ChunkStore::insert_locked(const ChunkId& id,
                                  std::span<const std::uint8_t> payload,
                                  HopCount hop_distance,
                                  std::vector<StoreChange>& changes) {
    const auto key = chunk_id_to_string(id);
    if (row_exists_locked(key)) {
        return id;
    }

    if (payload.size() > config_.max_chunk_bytes) {
        throw_error(ErrorCode::Capacity,
                    "chunk of " + std::to_string(payload.size()) + " bytes exceeds max_chunk_bytes",
                    "Split the payload with the configured chunk_size before storing it");
    }
    if (config_.store_capacity_bytes > 0 && used_bytes_ + payload.size() > config_.store_capacity_bytes) {
        throw_error(ErrorCode::Capacity, "store capacity exhausted for chunk " + short_id(id));
    }

    if (persistent_enabled_) {
        write_payload_locked(key, payload);
    }

    const auto now = to_unix_micros(std::chrono::system_clock::now());
    try {
        detail_statement stmt(db_,
                              "INSERT INTO chunks (id, size, created_at, last_access, access_seq, hop_distance, "
                              "access_count, payload) VALUES (?, ?, ?, ?, ?, ?, 0, ?);");
        stmt.bind(1, key);
        stmt.bind(2, static_cast<std::int64_t>(payload.size()));
        stmt.bind(3, now);
        stmt.bind(4, now);
        stmt.bind(5, ++access_sequence_);
        stmt.bind(6, static_cast<std::int64_t>(hop_distance));
        if (persistent_enabled_) {
            stmt.bind_null(7);
        } else {
            stmt.bind_blob(7, payload);
        }
        stmt.run();
    } catch (const Error&) {
        if (persistent_enabled_) {
            std::error_code ec;
            std::filesystem::remove(payload_path(id), ec);
        }
        throw;
    }

    used_bytes_ += payload.size();
    changes.push_back(StoreChange{StoreChange::Kind::Added, id, payload.size()});
    return id;
}

std::optional<Chunk> ChunkStore::get(const ChunkId& id) {
    std::vector<StoreChange> changes;
    std::optional<Chunk> result;
    {
        std::scoped_lock lock(mutex_);
        const auto key = chunk_id_to_string(id);
        const auto meta = read_metadata_locked(key);
        if (!meta.has_value()) {
            return std::nullopt;
        }

        auto payload = read_payload_locked(key);
        if (!payload.has_value() || crypto::identify(*payload) != id) {
            log::log_event(log::StructuredLogger::Level::Warning,
                           payload.has_value() ? "store.corrupt" : "store.payload_missing",
                           {{"chunk", short_id(id)}});
            erase_locked(key, meta->size);
            changes.push_back(StoreChange{StoreChange::Kind::Removed, id, meta->size});
        } else {
            touch_locked(key);
            Chunk chunk{};
            chunk.id = id;
            chunk.size = payload->size();
            chunk.payload = std::move(*payload);
            chunk.created_at = meta->created_at;
            result = std::move(chunk);
        }
    }
    notify(changes);
    return result;
}

bool ChunkStore::has(const ChunkId& id) const {
    std::scoped_lock lock(mutex_);
    return row_exists_locked(chunk_id_to_string(id));
}

bool ChunkStore::remove(const ChunkId& id) {
    std::vector<StoreChange> changes;
    {
        std::scoped_lock lock(mutex_);
        const auto key = chunk_id_to_string(id);
        const auto meta = read_metadata_locked(key);
        if (!meta.has_value()) {
            return false;
        }
        erase_locked(key, meta->size);
        changes.push_back(StoreChange{StoreChange::Kind::Removed, id, meta->size});
    }
    notify(changes);
    return true;
}

std::optional<ChunkMetadata> ChunkStore::metadata(const ChunkId& id) const {
    std::scoped_lock lock(mutex_);
    return read_metadata_locked(chunk_id_to_string(id));
}

std::vector<ChunkMetadata> ChunkStore::list_by_access_order(std::size_t limit, std::size_t offset) const {
    std::scoped_lock lock(mutex_);
    detail_statement stmt(db_,
                          "SELECT id, size, created_at, last_access, hop_distance, access_count FROM chunks "
                          "ORDER BY access_seq ASC LIMIT ? OFFSET ?;");
    stmt.bind(1, limit == 0 ? std::int64_t{-1} : static_cast<std::int64_t>(limit));
    stmt.bind(2, static_cast<std::int64_t>(offset));

    std::vector<ChunkMetadata> rows;
    while (stmt.step()) {
        rows.push_back(metadata_from_row(stmt));
    }
    return rows;
}

std::size_t ChunkStore::chunk_count() const {
    std::scoped_lock lock(mutex_);
    detail_statement stmt(db_, "SELECT COUNT(*) FROM chunks;");
    return stmt.step() ? static_cast<std::size_t>(stmt.column_int(0)) : 0;
}

std::uint64_t ChunkStore::used_bytes() const {
    std::scoped_lock lock(mutex_);
    return used_bytes_;
}

std::uint64_t ChunkStore::capacity_bytes() const noexcept {
    return config_.store_capacity_bytes;
}

double ChunkStore::utilization() const {
    if (config_.store_capacity_bytes == 0) {
        return 0.0;
    }
    return static_cast<double>(used_bytes()) / static_cast<double>(config_.store_capacity_bytes);
}

crypto::Sha256::Digest ChunkStore::inventory_digest() const {
    std::scoped_lock lock(mutex_);
    detail_statement stmt(db_, "SELECT id FROM chunks ORDER BY id ASC;");
    crypto::Sha256 hasher;
    while (stmt.step()) {
        if (const auto id = chunk_id_from_string(stmt.column_text(0))) {
            hasher.update(std::span<const std::uint8_t>(id->data(), id->size()));
        }
    }
    return hasher.finalize();
}

ChunkStore::ReconcileReport ChunkStore::reconcile() {
    ReconcileReport report{};
    if (!persistent_enabled_) {
        return report;
    }

    std::vector<StoreChange> changes;
    {
        std::scoped_lock lock(mutex_);

        std::error_code ec;
        std::vector<std::filesystem::path> stale;
        for (const auto& entry : std::filesystem::directory_iterator(chunk_root_, ec)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            const auto& path = entry.path();
            if (path.extension() == kTempExtension) {
                stale.push_back(path);
                continue;
            }
            if (path.extension() != kChunkExtension || !row_exists_locked(path.stem().string())) {
                stale.push_back(path);
            }
        }
        for (const auto& path : stale) {
            std::error_code remove_ec;
            if (std::filesystem::remove(path, remove_ec)) {
                ++report.orphan_files_removed;
            }
        }

        std::vector<std::pair<std::string, std::size_t>> missing;
        {
            detail_statement stmt(db_, "SELECT id, size FROM chunks;");
            while (stmt.step()) {
                auto key = stmt.column_text(0);
                if (!std::filesystem::exists(chunk_root_ / (key + kChunkExtension), ec)) {
                    missing.emplace_back(std::move(key), static_cast<std::size_t>(stmt.column_int(1)));
                }
            }
        }
        for (const auto& [key, size] : missing) {
            erase_locked(key, size);
            ++report.missing_payloads_dropped;
            if (const auto id = chunk_id_from_string(key)) {
                changes.push_back(StoreChange{StoreChange::Kind::Removed, *id, size});
            }
        }
    }
    notify(changes);
    return report;
}

std::vector<ChunkId> ChunkStore::verify_all() {
    std::vector<ChunkId> purged;
    std::vector<StoreChange> changes;
    {
        std::scoped_lock lock(mutex_);
        std::vector<std::pair<std::string, std::size_t>> rows;
        {
            detail_statement stmt(db_, "SELECT id, size FROM chunks;");
            while (stmt.step()) {
                rows.emplace_back(stmt.column_text(0), static_cast<std::size_t>(stmt.column_int(1)));
            }
        }

        for (const auto& [key, size] : rows) {
            const auto id = chunk_id_from_string(key);
            const auto payload = read_payload_locked(key);
            if (id.has_value() && payload.has_value() && crypto::identify(*payload) == *id) {
                continue;
            }
            erase_locked(key, size);
            if (id.has_value()) {
                purged.push_back(*id);
                changes.push_back(StoreChange{StoreChange::Kind::Removed, *id, size});
            }
        }
    }
    notify(changes);
    return purged;
}

void ChunkStore::set_observer(StoreObserver observer) {
    std::scoped_lock lock(mutex_);
    observer_ = std::move(observer);
}

bool ChunkStore::row_exists_locked(const std::string& key) const {
    detail_statement stmt(db_, "SELECT 1 FROM chunks WHERE id = ? LIMIT 1;");
    stmt.bind(1, key);
    return stmt.step();
}

std::optional<ChunkMetadata> ChunkStore::read_metadata_locked(const std::string& key) const {
    detail_statement stmt(db_,
                          "SELECT id, size, created_at, last_access, hop_distance, access_count FROM chunks "
                          "WHERE id = ?;");
    stmt.bind(1, key);
    if (!stmt.step()) {
        return std::nullopt;
    }
    return metadata_from_row(stmt);
}

std::optional<ChunkData> ChunkStore::read_payload_locked(const std::string& key) const {
    if (!persistent_enabled_) {
        detail_statement stmt(db_, "SELECT payload FROM chunks WHERE id = ?;");
        stmt.bind(1, key);
        if (!stmt.step() || stmt.column_is_null(0)) {
            return std::nullopt;
        }
        return stmt.column_blob(0);
    }

    std::ifstream stream(chunk_root_ / (key + kChunkExtension), std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }
    return ChunkData(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
}

void ChunkStore::write_payload_locked(const std::string& key, std::span<const std::uint8_t> payload) {
    const auto final_path = chunk_root_ / (key + kChunkExtension);
    auto temp_path = final_path;
    temp_path += kTempExtension;

    {
        std::ofstream stream(temp_path, std::ios::binary | std::ios::trunc);
        if (stream) {
            stream.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
            stream.flush();
        }
        if (!stream) {
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw_error(ErrorCode::Storage, "failed to write chunk payload " + temp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, final_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw_error(ErrorCode::Storage, "failed to commit chunk payload " + final_path.string());
    }
}

void ChunkStore::erase_locked(const std::string& key, std::size_t size) {
    detail_statement stmt(db_, "DELETE FROM chunks WHERE id = ?;");
    stmt.bind(1, key);
    stmt.run();

    if (persistent_enabled_) {
        std::error_code ec;
        std::filesystem::remove(chunk_root_ / (key + kChunkExtension), ec);
    }
    used_bytes_ -= std::min<std::uint64_t>(used_bytes_, size);
}

void ChunkStore::touch_locked(const std::string& key) {
    detail_statement stmt(db_,
                          "UPDATE chunks SET last_access = ?, access_seq = ?, access_count = access_count + 1 "
                          "WHERE id = ?;");
    stmt.bind(1, to_unix_micros(std::chrono::system_clock::now()));
    stmt.bind(2, ++access_sequence_);
    stmt.bind(3, key);
    stmt.run();
}

void ChunkStore::notify(const std::vector<StoreChange>& changes) const {
    if (changes.empty()) {
        return;
    }
    StoreObserver observer;
    {
        std::scoped_lock lock(mutex_);
        observer = observer_;
    }
    if (!observer) {
        return;
    }
    for (const auto& change : changes) {
        observer(change);
    }
}

}  // namespace meshcache
