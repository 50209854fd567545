#pragma once

#include "meshcache/Config.hpp"
#include "meshcache/Export.hpp"
#include "meshcache/protocol/Manifest.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

struct sqlite3;

namespace meshcache {

// Read side the replication core uses to expand a file identity into chunks.
class ManifestResolver {
public:
    virtual ~ManifestResolver() = default;

    virtual std::optional<protocol::FileManifest> find(const ChunkId& manifest_id) const = 0;
    virtual void record(const protocol::FileManifest& manifest) = 0;
    virtual bool remove(const ChunkId& manifest_id) = 0;
    virtual std::vector<protocol::FileManifest> list() const = 0;
};

// Manifests keyed by identity, in manifests.sqlite3 under the storage
// directory or in memory when persistence is disabled.
class MESHCACHE_API ManifestIndex : public ManifestResolver {
public:
    explicit ManifestIndex(const Config& config = {});
    ~ManifestIndex() override;

    ManifestIndex(const ManifestIndex&) = delete;
    ManifestIndex& operator=(const ManifestIndex&) = delete;

    std::optional<protocol::FileManifest> find(const ChunkId& manifest_id) const override;
    void record(const protocol::FileManifest& manifest) override;

    bool remove(const ChunkId& manifest_id) override;
    std::vector<protocol::FileManifest> list() const override;
    std::size_t size() const;

private:
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;
};

}  // namespace meshcache
