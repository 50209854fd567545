#pragma once

#include "meshcache/Export.hpp"
#include "meshcache/Types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <vector>

namespace meshcache::protocol {

struct FileManifest {
    ChunkId manifest_id{};
    std::string name;
    PeerId publisher{};
    std::uint64_t total_size{0};
    std::uint32_t chunk_size{0};
    std::vector<ChunkId> chunks;
    std::chrono::system_clock::time_point created_at{};
    std::map<std::string, std::string> metadata;
};

// sha256 over the ordered concatenation of chunk identities.
MESHCACHE_API ChunkId compute_manifest_id(const std::vector<ChunkId>& chunks);

// Fills manifest_id from chunks. Other fields are left as given.
MESHCACHE_API void seal_manifest(FileManifest& manifest);

MESHCACHE_API std::vector<std::span<const std::uint8_t>> split_payload(std::span<const std::uint8_t> payload,
                                                                       std::size_t chunk_size);

MESHCACHE_API std::vector<std::uint8_t> encode_manifest(const FileManifest& manifest);
// Throws Error{InvalidArgument} on truncation, Error{Integrity} when the
// embedded identity does not match the chunk list.
MESHCACHE_API FileManifest decode_manifest(std::span<const std::uint8_t> buffer);

MESHCACHE_API std::string manifest_to_uri(const FileManifest& manifest);
MESHCACHE_API FileManifest manifest_from_uri(const std::string& uri);

}  // namespace meshcache::protocol
