#include "meshcache/core/RequestLedger.hpp"

#include <algorithm>
#include <utility>

namespace meshcache {

std::string_view request_kind_to_string(RequestKind kind) noexcept {
    switch (kind) {
        case RequestKind::Fetch:
            return "fetch";
        case RequestKind::Offer:
            return "offer";
    }
    return "fetch";
}

std::string_view request_state_to_string(RequestState state) noexcept {
    switch (state) {
        case RequestState::Pending:
            return "pending";
        case RequestState::Resolved:
            return "resolved";
        case RequestState::Failed:
            return "failed";
    }
    return "pending";
}

RequestLedger::RequestLedger(Config config)
    : config_(std::move(config)) {}

std::chrono::seconds RequestLedger::backoff_for(std::uint32_t attempts) const {
    auto base = config_.fetch_retry_initial_backoff;
    if (base <= std::chrono::seconds::zero()) {
        base = std::chrono::seconds{1};
    }

    const std::uint32_t exponent = attempts > 0 ? attempts - 1 : 0;
    const std::uint32_t clamped_exponent = std::min<std::uint32_t>(exponent, 8);
    auto backoff = base * (1 << clamped_exponent);

    if (config_.fetch_retry_max_backoff > std::chrono::seconds::zero() && backoff > config_.fetch_retry_max_backoff) {
        backoff = config_.fetch_retry_max_backoff;
    }
    return backoff;
}

RegisterOutcome RequestLedger::register_request(const ChunkId& id,
                                                RequestKind kind,
                                                const Subscriber& subscriber,
                                                std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(mutex_);
    const Key key{id, kind};

    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.state == RequestState::Pending) {
        auto& entry = it->second;
        if (std::find(entry.subscribers.begin(), entry.subscribers.end(), subscriber) == entry.subscribers.end()) {
            entry.subscribers.push_back(subscriber);
        }
        return RegisterOutcome{entry, false};
    }

    RequestEntry fresh{};
    fresh.id = id;
    fresh.kind = kind;
    fresh.state = RequestState::Pending;
    fresh.requested_at = now;
    fresh.next_attempt_at = now;
    fresh.subscribers.push_back(subscriber);

    if (it != entries_.end()) {
        // Reopened during the grace window: providers learned earlier stay useful.
        fresh.sources = std::move(it->second.sources);
        it->second = std::move(fresh);
        return RegisterOutcome{it->second, true};
    }

    const auto inserted = entries_.emplace(key, std::move(fresh)).first;
    return RegisterOutcome{inserted->second, true};
}

Resolution RequestLedger::resolve(const ChunkId& id, RequestKind kind, std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(mutex_);
    auto* entry = find_pending_locked(id, kind);
    if (entry == nullptr) {
        return {};
    }

    entry->state = RequestState::Resolved;
    entry->resolved_at = now;
    entry->in_flight = false;
    entry->last_failure.reset();

    Resolution resolution{};
    resolution.resolved = true;
    resolution.subscribers = entry->subscribers;
    return resolution;
}

std::optional<FailureOutcome> RequestLedger::fail(const ChunkId& id,
                                                  RequestKind kind,
                                                  ErrorCode reason,
                                                  std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(mutex_);
    auto* entry = find_pending_locked(id, kind);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return fail_locked(*entry, reason, now);
}

FailureOutcome RequestLedger::fail_locked(RequestEntry& entry,
                                          ErrorCode reason,
                                          std::chrono::steady_clock::time_point now) {
    ++entry.attempts;
    entry.in_flight = false;
    entry.last_failure = reason;

    FailureOutcome outcome{};
    outcome.id = entry.id;
    outcome.kind = entry.kind;
    outcome.reason = reason;
    outcome.attempts = entry.attempts;

    const auto limit = static_cast<std::uint32_t>(config_.fetch_retry_attempt_limit);
    const bool exhausted = entry.kind == RequestKind::Offer || (limit > 0 && entry.attempts >= limit);
    if (exhausted) {
        entry.state = RequestState::Failed;
        entry.resolved_at = now;
        entry.next_attempt_at = std::chrono::steady_clock::time_point::max();
        outcome.terminal = true;
        outcome.subscribers = entry.subscribers;
        outcome.next_attempt_at = entry.next_attempt_at;
        return outcome;
    }

    entry.next_attempt_at = now + backoff_for(entry.attempts);
    outcome.next_attempt_at = entry.next_attempt_at;
    return outcome;
}

std::vector<FailureOutcome> RequestLedger::expire(std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(mutex_);
    std::vector<FailureOutcome> outcomes;

    for (auto& [key, entry] : entries_) {
        if (entry.state != RequestState::Pending) {
            continue;
        }
        if (entry.kind == RequestKind::Offer) {
            if (now - entry.requested_at >= config_.offer_ttl) {
                outcomes.push_back(fail_locked(entry, ErrorCode::Timeout, now));
            }
            continue;
        }
        if (entry.in_flight && now - entry.last_attempt_at >= config_.request_timeout) {
            outcomes.push_back(fail_locked(entry, ErrorCode::Timeout, now));
        }
    }

    return outcomes;
}

bool RequestLedger::note_attempt(const ChunkId& id,
                                 RequestKind kind,
                                 const PeerId& source,
                                 std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(mutex_);
    auto* entry = find_pending_locked(id, kind);
    if (entry == nullptr) {
        return false;
    }
    entry->in_flight = true;
    entry->last_attempt_at = now;
    entry->current_source = source;
    return true;
}

bool RequestLedger::add_source(const ChunkId& id, RequestKind kind, const PeerId& peer) {
    std::scoped_lock lock(mutex_);
    auto* entry = find_pending_locked(id, kind);
    if (entry == nullptr) {
        return false;
    }
    if (std::find(entry->sources.begin(), entry->sources.end(), peer) != entry->sources.end()) {
        return false;
    }
    entry->sources.push_back(peer);
    return true;
}

std::optional<PeerId> RequestLedger::next_source(const ChunkId& id, RequestKind kind) {
    std::scoped_lock lock(mutex_);
    auto* entry = find_pending_locked(id, kind);
    if (entry == nullptr || entry->sources.empty()) {
        return std::nullopt;
    }

    const auto waiting = [&](const PeerId& peer) {
        return std::any_of(entry->subscribers.begin(), entry->subscribers.end(), [&](const Subscriber& subscriber) {
            return !subscriber.is_local() && subscriber.peer == peer;
        });
    };

    const auto count = entry->sources.size();
    for (std::size_t step = 0; step < count; ++step) {
        const auto& candidate = entry->sources[entry->source_cursor % count];
        ++entry->source_cursor;
        if (!waiting(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

bool RequestLedger::cancel(const ChunkId& id, RequestKind kind, const Subscriber& subscriber) {
    std::scoped_lock lock(mutex_);
    auto it = entries_.find(Key{id, kind});
    if (it == entries_.end() || it->second.state != RequestState::Pending) {
        return false;
    }

    auto& subscribers = it->second.subscribers;
    subscribers.erase(std::remove(subscribers.begin(), subscribers.end(), subscriber), subscribers.end());
    if (!subscribers.empty()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::vector<std::pair<ChunkId, RequestKind>> RequestLedger::cancel_subscriber(const Subscriber& subscriber) {
    std::scoped_lock lock(mutex_);
    std::vector<std::pair<ChunkId, RequestKind>> torn_down;

    for (auto it = entries_.begin(); it != entries_.end();) {
        auto& entry = it->second;
        if (entry.state != RequestState::Pending) {
            ++it;
            continue;
        }
        const auto before = entry.subscribers.size();
        entry.subscribers.erase(std::remove(entry.subscribers.begin(), entry.subscribers.end(), subscriber),
                                entry.subscribers.end());
        if (before != entry.subscribers.size() && entry.subscribers.empty()) {
            torn_down.emplace_back(it->first);
            it = entries_.erase(it);
            continue;
        }
        ++it;
    }

    return torn_down;
}

std::vector<ChunkId> RequestLedger::due_for_retry(std::chrono::steady_clock::time_point now) const {
    std::scoped_lock lock(mutex_);
    std::vector<ChunkId> due;
    for (const auto& [key, entry] : entries_) {
        if (entry.kind != RequestKind::Fetch || entry.state != RequestState::Pending) {
            continue;
        }
        if (!entry.in_flight && entry.attempts > 0 && entry.next_attempt_at <= now) {
            due.push_back(entry.id);
        }
    }
    return due;
}

std::size_t RequestLedger::sweep(std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(mutex_);
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        const auto& entry = it->second;
        if (entry.state != RequestState::Pending && now - entry.resolved_at >= config_.ledger_resolved_grace) {
            it = entries_.erase(it);
            ++removed;
            continue;
        }
        ++it;
    }
    return removed;
}

bool RequestLedger::is_pinned(const ChunkId& id) const {
    std::scoped_lock lock(mutex_);
    for (const auto kind : {RequestKind::Fetch, RequestKind::Offer}) {
        const auto it = entries_.find(Key{id, kind});
        if (it != entries_.end() && it->second.state == RequestState::Pending) {
            return true;
        }
    }
    return false;
}

std::optional<RequestEntry> RequestLedger::find(const ChunkId& id, RequestKind kind) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(Key{id, kind});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t RequestLedger::pending_count(RequestKind kind) const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(), [&](const auto& item) {
        return item.first.second == kind && item.second.state == RequestState::Pending;
    }));
}

RequestEntry* RequestLedger::find_pending_locked(const ChunkId& id, RequestKind kind) {
    auto it = entries_.find(Key{id, kind});
    if (it == entries_.end() || it->second.state != RequestState::Pending) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace meshcache
