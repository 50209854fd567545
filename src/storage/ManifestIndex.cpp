#include "meshcache/storage/ManifestIndex.hpp"

#include "meshcache/Error.hpp"
#include "meshcache/log/StructuredLogger.hpp"
#include "SqliteSupport.hpp"

namespace meshcache {

namespace {

using storage::detail::Statement;

constexpr char kSchema[] =
    "CREATE TABLE IF NOT EXISTS manifests ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " created_at INTEGER NOT NULL,"
    " encoded BLOB NOT NULL"
    ");";

std::optional<protocol::FileManifest> decode_row(const Statement& row) {
    const auto encoded = row.column_blob(0);
    try {
        return protocol::decode_manifest(encoded);
    } catch (const Error& error) {
        log::log_event(log::StructuredLogger::Level::Warning,
                       "manifest.decode_failed",
                       {{"code", std::string(error_code_to_string(error.code()))}, {"reason", error.message()}});
        return std::nullopt;
    }
}

}  // namespace

ManifestIndex::ManifestIndex(const Config& config) {
    std::string path = ":memory:";
    if (config.storage_persistent_enabled) {
        const std::filesystem::path root(config.storage_directory.empty() ? "storage" : config.storage_directory);
        std::error_code ec;
        std::filesystem::create_directories(root, ec);
        path = (root / "manifests.sqlite3").string();
    }
    db_ = storage::detail::open_database(path);
    storage::detail::exec(db_, kSchema);
}

ManifestIndex::~ManifestIndex() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

std::optional<protocol::FileManifest> ManifestIndex::find(const ChunkId& manifest_id) const {
    std::scoped_lock lock(mutex_);
    Statement stmt(db_, "SELECT encoded FROM manifests WHERE id = ?;");
    stmt.bind(1, chunk_id_to_string(manifest_id));
    if (!stmt.step()) {
        return std::nullopt;
    }
    return decode_row(stmt);
}

void ManifestIndex::record(const protocol::FileManifest& manifest) {
    if (protocol::compute_manifest_id(manifest.chunks) != manifest.manifest_id) {
        throw_error(ErrorCode::Integrity, "refusing to index a manifest whose identity does not match its chunks");
    }
    const auto encoded = protocol::encode_manifest(manifest);

    std::scoped_lock lock(mutex_);
    Statement stmt(db_, "INSERT OR REPLACE INTO manifests (id, name, created_at, encoded) VALUES (?, ?, ?, ?);");
    stmt.bind(1, chunk_id_to_string(manifest.manifest_id));
    stmt.bind(2, manifest.name);
    stmt.bind(3, storage::detail::to_unix_micros(manifest.created_at));
    stmt.bind_blob(4, encoded);
    stmt.run();
}

bool ManifestIndex::remove(const ChunkId& manifest_id) {
    std::scoped_lock lock(mutex_);
    Statement stmt(db_, "DELETE FROM manifests WHERE id = ?;");
    stmt.bind(1, chunk_id_to_string(manifest_id));
    stmt.run();
    return sqlite3_changes(db_) > 0;
}

std::vector<protocol::FileManifest> ManifestIndex::list() const {
    std::scoped_lock lock(mutex_);
    Statement stmt(db_, "SELECT encoded FROM manifests ORDER BY created_at ASC, name ASC;");
    std::vector<protocol::FileManifest> manifests;
    while (stmt.step()) {
        if (auto manifest = decode_row(stmt)) {
            manifests.push_back(std::move(*manifest));
        }
    }
    return manifests;
}

std::size_t ManifestIndex::size() const {
    std::scoped_lock lock(mutex_);
    Statement stmt(db_, "SELECT COUNT(*) FROM manifests;");
    return stmt.step() ? static_cast<std::size_t>(stmt.column_int(0)) : 0;
}

}  // namespace meshcache
