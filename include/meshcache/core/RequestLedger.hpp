#pragma once

#include "meshcache/Config.hpp"
#include "meshcache/Error.hpp"
#include "meshcache/Export.hpp"
#include "meshcache/Types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace meshcache {

enum class RequestKind : std::uint8_t {
    Fetch,
    Offer
};

enum class RequestState : std::uint8_t {
    Pending,
    Resolved,
    Failed
};

std::string_view request_kind_to_string(RequestKind kind) noexcept;
std::string_view request_state_to_string(RequestState state) noexcept;

// A party waiting on an entry: a local API handle or a remote peer.
struct Subscriber {
    PeerId peer{};
    std::uint64_t handle{0};

    static Subscriber local(std::uint64_t handle) {
        return Subscriber{PeerId{}, handle};
    }

    static Subscriber remote(const PeerId& peer) {
        return Subscriber{peer, 0};
    }

    bool is_local() const noexcept {
        return handle != 0;
    }

    bool operator==(const Subscriber& other) const = default;
};

struct RequestEntry {
    ChunkId id{};
    RequestKind kind{RequestKind::Fetch};
    RequestState state{RequestState::Pending};
    std::chrono::steady_clock::time_point requested_at{};
    std::chrono::steady_clock::time_point last_attempt_at{};
    std::chrono::steady_clock::time_point next_attempt_at{};
    std::chrono::steady_clock::time_point resolved_at{};
    std::vector<Subscriber> subscribers;
    std::vector<PeerId> sources;
    std::size_t source_cursor{0};
    std::optional<PeerId> current_source;
    bool in_flight{false};
    std::uint32_t attempts{0};
    std::optional<ErrorCode> last_failure;
};

struct RegisterOutcome {
    RequestEntry entry;
    bool created{false};
};

struct Resolution {
    bool resolved{false};
    std::vector<Subscriber> subscribers;
};

struct FailureOutcome {
    ChunkId id{};
    RequestKind kind{RequestKind::Fetch};
    ErrorCode reason{ErrorCode::Failed};
    bool terminal{false};
    std::uint32_t attempts{0};
    std::chrono::steady_clock::time_point next_attempt_at{};
    // Populated only when terminal.
    std::vector<Subscriber> subscribers;
};

/**
 * Lifecycle of every identity being fetched or offered.
 *
 * There is at most one Pending entry per (identity, kind); concurrent
 * interest joins its subscriber list. Resolved and Failed entries linger for
 * ledger_resolved_grace so late duplicates are absorbed, then sweep() drops
 * them. All times are supplied by the caller.
 */
class MESHCACHE_API RequestLedger {
public:
    explicit RequestLedger(Config config = {});

    RegisterOutcome register_request(const ChunkId& id,
                                     RequestKind kind,
                                     const Subscriber& subscriber,
                                     std::chrono::steady_clock::time_point now);
    Resolution resolve(const ChunkId& id, RequestKind kind, std::chrono::steady_clock::time_point now);
    std::optional<FailureOutcome> fail(const ChunkId& id,
                                       RequestKind kind,
                                       ErrorCode reason,
                                       std::chrono::steady_clock::time_point now);
    std::vector<FailureOutcome> expire(std::chrono::steady_clock::time_point now);

    bool note_attempt(const ChunkId& id,
                      RequestKind kind,
                      const PeerId& source,
                      std::chrono::steady_clock::time_point now);
    bool add_source(const ChunkId& id, RequestKind kind, const PeerId& peer);
    // Rotates through known sources, skipping peers that are themselves waiting on the entry.
    std::optional<PeerId> next_source(const ChunkId& id, RequestKind kind);

    // True when the entry was torn down because no subscriber remains.
    bool cancel(const ChunkId& id, RequestKind kind, const Subscriber& subscriber);
    std::vector<std::pair<ChunkId, RequestKind>> cancel_subscriber(const Subscriber& subscriber);

    std::vector<ChunkId> due_for_retry(std::chrono::steady_clock::time_point now) const;
    std::size_t sweep(std::chrono::steady_clock::time_point now);

    [[nodiscard]] bool is_pinned(const ChunkId& id) const;
    std::optional<RequestEntry> find(const ChunkId& id, RequestKind kind) const;
    std::size_t pending_count(RequestKind kind) const;

    std::chrono::seconds backoff_for(std::uint32_t attempts) const;

private:
    using Key = std::pair<ChunkId, RequestKind>;

    Config config_;
    std::map<Key, RequestEntry> entries_;
    mutable std::mutex mutex_;

    RequestEntry* find_pending_locked(const ChunkId& id, RequestKind kind);
    FailureOutcome fail_locked(RequestEntry& entry, ErrorCode reason, std::chrono::steady_clock::time_point now);
};

}  // namespace meshcache
