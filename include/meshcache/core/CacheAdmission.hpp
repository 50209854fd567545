#pragma once

#include "meshcache/Config.hpp"
#include "meshcache/Export.hpp"
#include "meshcache/Types.hpp"
#include "meshcache/storage/ChunkStore.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace meshcache {

struct AdmissionContext {
    std::uint64_t used_bytes{0};
    std::uint64_t capacity_bytes{0};
    std::optional<double> least_valuable_score;
};

struct AdmissionDecision {
    bool admit{false};
    std::uint64_t bytes_to_free{0};
    double candidate_score{0.0};
    std::string reason;
};

struct ScoredChunk {
    ChunkId id{};
    std::size_t size{0};
    double score{0.0};
};

using PinPredicate = std::function<bool(const ChunkId&)>;

class MESHCACHE_API CacheAdmission {
public:
    explicit CacheAdmission(const Config& config);

    AdmissionDecision should_admit(const ChunkMetadata& candidate,
                                   const AdmissionContext& context,
                                   std::chrono::system_clock::time_point now) const;

    // Least recently used first; empty when target_free_bytes cannot be reached
    // without touching a pinned chunk.
    std::vector<ChunkId> select_evictions(const std::vector<ChunkMetadata>& snapshot,
                                          std::uint64_t target_free_bytes,
                                          const PinPredicate& pinned) const;

    double score(const ChunkMetadata& chunk, std::chrono::system_clock::time_point now) const;

    std::optional<ScoredChunk> least_valuable(const std::vector<ChunkMetadata>& snapshot,
                                              const PinPredicate& pinned,
                                              std::chrono::system_clock::time_point now) const;

    double high_water() const noexcept {
        return high_water_;
    }

private:
    AdmissionWeights weights_;
    double high_water_;
};

}  // namespace meshcache
