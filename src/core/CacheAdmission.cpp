#include "meshcache/core/CacheAdmission.hpp"

#include <algorithm>
#include <cmath>

namespace meshcache {

CacheAdmission::CacheAdmission(const Config& config)
    : weights_(config.admission_weights),
      high_water_(std::clamp(config.admission_high_water, 0.0, 1.0)) {}

double CacheAdmission::score(const ChunkMetadata& chunk, std::chrono::system_clock::time_point now) const {
    const auto age = now > chunk.last_access ? now - chunk.last_access : std::chrono::system_clock::duration::zero();
    const double age_minutes = std::chrono::duration<double, std::ratio<60>>(age).count();
    const double size_kib = static_cast<double>(chunk.size) / 1024.0;

    const double demand = weights_.demand * std::log2(1.0 + static_cast<double>(chunk.access_count));
    const double recency = weights_.recency / (1.0 + age_minutes);
    const double locality = weights_.locality / (1.0 + static_cast<double>(chunk.hop_distance));
    const double size_penalty = weights_.size_penalty * size_kib;

    return demand + recency + locality - size_penalty;
}

AdmissionDecision CacheAdmission::should_admit(const ChunkMetadata& candidate,
                                               const AdmissionContext& context,
                                               std::chrono::system_clock::time_point now) const {
    AdmissionDecision decision{};
    decision.candidate_score = score(candidate, now);

    if (context.capacity_bytes == 0) {
        decision.admit = true;
        decision.reason = "unbounded";
        return decision;
    }
    if (candidate.size > context.capacity_bytes) {
        decision.reason = "larger than store";
        return decision;
    }

    const auto projected = context.used_bytes + candidate.size;
    const auto high_water_bytes = static_cast<std::uint64_t>(
        std::floor(static_cast<double>(context.capacity_bytes) * high_water_));

    if (projected <= high_water_bytes) {
        decision.admit = true;
        decision.reason = "below high water";
        return decision;
    }

    if (!context.least_valuable_score.has_value()) {
        // Nothing evictable; admit only while the hard capacity still holds.
        decision.admit = projected <= context.capacity_bytes;
        decision.reason = decision.admit ? "fits without eviction" : "no evictable resident";
        return decision;
    }

    if (decision.candidate_score <= *context.least_valuable_score) {
        decision.reason = "scores below least valuable resident";
        return decision;
    }

    decision.admit = true;
    decision.bytes_to_free = projected - high_water_bytes;
    decision.reason = "outscores least valuable resident";
    return decision;
}

std::vector<ChunkId> CacheAdmission::select_evictions(const std::vector<ChunkMetadata>& snapshot,
                                                      std::uint64_t target_free_bytes,
                                                      const PinPredicate& pinned) const {
    std::vector<ChunkId> victims;
    if (target_free_bytes == 0) {
        return victims;
    }

    std::uint64_t reclaimed = 0;
    for (const auto& chunk : snapshot) {
        if (pinned && pinned(chunk.id)) {
            continue;
        }
        victims.push_back(chunk.id);
        reclaimed += chunk.size;
        if (reclaimed >= target_free_bytes) {
            return victims;
        }
    }
    return {};
}

std::optional<ScoredChunk> CacheAdmission::least_valuable(const std::vector<ChunkMetadata>& snapshot,
                                                          const PinPredicate& pinned,
                                                          std::chrono::system_clock::time_point now) const {
    std::optional<ScoredChunk> lowest;
    for (const auto& chunk : snapshot) {
        if (pinned && pinned(chunk.id)) {
            continue;
        }
        const auto value = score(chunk, now);
        if (!lowest.has_value() || value < lowest->score) {
            lowest = ScoredChunk{chunk.id, chunk.size, value};
        }
    }
    return lowest;
}

}  // namespace meshcache
