#pragma once

#include "meshcache/Types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace meshcache {

struct AdmissionWeights {
    double demand{1.0};
    double recency{2.0};
    double locality{0.5};
    double size_penalty{0.01};
};

struct Config {
    bool storage_persistent_enabled{false};
    std::string storage_directory{"storage"};
    std::uint64_t store_capacity_bytes{64ull * 1024ull * 1024ull};
    std::size_t chunk_size{10'240};
    std::size_t max_chunk_bytes{256ull * 1024ull};

    double admission_high_water{0.90};
    AdmissionWeights admission_weights{};
    std::size_t standby_queue_limit{32};

    std::uint8_t fetch_retry_attempt_limit{5};
    std::chrono::seconds fetch_retry_initial_backoff{std::chrono::seconds(3)};
    std::chrono::seconds fetch_retry_max_backoff{std::chrono::seconds(60)};
    std::chrono::seconds request_timeout{std::chrono::seconds(30)};
    std::chrono::seconds ledger_resolved_grace{std::chrono::seconds(20)};
    std::chrono::seconds offer_ttl{std::chrono::minutes(10)};

    bool relay_enabled{true};
    std::uint64_t auto_fetch_max_bytes{0};
    std::uint16_t offer_fanout{3};
    std::uint16_t fetch_source_fanout{4};

    std::optional<std::uint32_t> identity_seed{};
    bool log_enabled{true};
};

}  // namespace meshcache
