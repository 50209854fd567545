#include "meshcache/core/ReplicationCoordinator.hpp"

#include "meshcache/crypto/Sha256.hpp"
#include "meshcache/log/StructuredLogger.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace meshcache {

namespace {

using Level = log::StructuredLogger::Level;

constexpr std::size_t kKnownSourceLimit = 8;
// Rows read per step when walking the store in access order.
constexpr std::size_t kEvictionScanPage = 64;

bool has_local_subscriber(const std::vector<Subscriber>& subscribers) {
    return std::any_of(subscribers.begin(), subscribers.end(), [](const Subscriber& subscriber) {
        return subscriber.is_local();
    });
}

std::string seconds_field(std::chrono::steady_clock::duration duration) {
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(duration).count());
}

}  // namespace

ReplicationCoordinator::ReplicationCoordinator(PeerId self_id,
                                               const Config& config,
                                               ChunkStore& store,
                                               RequestLedger& ledger,
                                               const CacheAdmission& admission,
                                               ManifestResolver& resolver,
                                               network::Transport& transport,
                                               const network::PeerRouter& router,
                                               CoordinatorListener* listener)
    : self_id_(self_id),
      config_(config),
      store_(store),
      ledger_(ledger),
      admission_(admission),
      resolver_(resolver),
      transport_(transport),
      router_(router),
      listener_(listener),
      clock_([] { return std::chrono::steady_clock::now(); }) {
    // Offers matched by the interest filter or a subscribed manifest are fetched under this handle.
    interest_handle_ = next_handle_++;

    if (config_.auto_fetch_max_bytes > 0) {
        const auto limit = config_.auto_fetch_max_bytes;
        interest_filter_ = [limit](const ChunkId&, std::uint32_t size, HopCount) {
            return size > 0 && size <= limit;
        };
    }

    for (const auto& manifest : resolver_.list()) {
        if (manifest.publisher != self_id_) {
            continue;
        }
        for (const auto& id : manifest.chunks) {
            published_chunks_.insert(chunk_id_to_string(id));
        }
    }

    store_.set_observer([this](const StoreChange& change) { on_store_changed(change); });
}

ReplicationCoordinator::~ReplicationCoordinator() {
    store_.set_observer({});
}

std::chrono::steady_clock::time_point ReplicationCoordinator::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void ReplicationCoordinator::set_listener(CoordinatorListener* listener) {
    std::scoped_lock lock(scheduler_mutex_);
    listener_ = listener;
}

void ReplicationCoordinator::set_clock(SteadyClockFn clock) {
    std::scoped_lock lock(scheduler_mutex_);
    clock_ = std::move(clock);
}

void ReplicationCoordinator::set_interest_filter(InterestFilter filter) {
    std::scoped_lock lock(scheduler_mutex_);
    interest_filter_ = std::move(filter);
}

std::size_t ReplicationCoordinator::standby_size() const {
    std::scoped_lock lock(scheduler_mutex_);
    return standby_.size();
}

RequestHandle ReplicationCoordinator::fetch(const ChunkId& target) {
    return fetch(target, now());
}

RequestHandle ReplicationCoordinator::fetch(const ChunkId& target, std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);

    const auto handle = next_handle_++;
    HandleState state{};
    state.target = target;

    if (auto manifest = resolver_.find(target)) {
        state.manifest_id = manifest->manifest_id;
        state.chunks = std::move(manifest->chunks);
    } else {
        state.chunks.push_back(target);
    }

    std::vector<ChunkId> missing;
    std::unordered_set<std::string> seen;
    for (const auto& id : state.chunks) {
        auto key = chunk_id_to_string(id);
        if (!seen.insert(key).second || store_.has(id)) {
            continue;
        }
        state.outstanding.insert(std::move(key));
        missing.push_back(id);
    }

    const bool already_complete = state.outstanding.empty();
    if (already_complete) {
        state.complete_notified = true;
    }
    const auto manifest_id = state.manifest_id;
    handles_.emplace(handle, std::move(state));
    if (already_complete) {
        mark_finished_locked(handle);
    }

    log::log_event(Level::Info,
                   "fetch.start",
                   {{"handle", std::to_string(handle)},
                    {"target", short_id(target)},
                    {"missing", std::to_string(missing.size())}});

    if (already_complete) {
        if (listener_ != nullptr && manifest_id.has_value()) {
            listener_->on_file_complete(handle, *manifest_id);
        }
        return handle;
    }

    for (const auto& id : missing) {
        const auto outcome = ledger_.register_request(id, RequestKind::Fetch, Subscriber::local(handle), now);
        if (outcome.created) {
            dispatch_fetch_locked(id, now);
        }
    }

    return handle;
}

protocol::FileManifest ReplicationCoordinator::publish(std::span<const std::uint8_t> payload,
                                                       const std::string& name,
                                                       std::map<std::string, std::string> metadata) {
    return publish(payload, name, std::move(metadata), now());
}

protocol::FileManifest ReplicationCoordinator::publish(std::span<const std::uint8_t> payload,
                                                       const std::string& name,
                                                       std::map<std::string, std::string> metadata,
                                                       std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);

    if (store_.capacity_bytes() > 0 && payload.size() > store_.capacity_bytes()) {
        throw_error(ErrorCode::Capacity,
                    "file of " + std::to_string(payload.size()) + " bytes exceeds store capacity",
                    "Raise store_capacity_bytes in the configuration");
    }

    protocol::FileManifest manifest{};
    manifest.name = name;
    manifest.publisher = self_id_;
    manifest.total_size = payload.size();
    manifest.chunk_size = static_cast<std::uint32_t>(config_.chunk_size);
    manifest.created_at = std::chrono::system_clock::now();
    manifest.metadata = std::move(metadata);

    const PinPredicate pinned = [this](const ChunkId& id) { return retained_locally_locked(id); };

    std::vector<std::size_t> sizes;
    std::vector<std::string> claimed;
    for (const auto piece : protocol::split_payload(payload, config_.chunk_size)) {
        if (!make_room_locked(piece.size(), pinned)) {
            for (const auto& key : claimed) {
                published_chunks_.erase(key);
            }
            throw_error(ErrorCode::Capacity,
                        "store cannot make room for " + name,
                        "Free space with 'meshcache evict' or raise store_capacity_bytes");
        }
        const auto id = store_.put(piece, 0);
        auto key = chunk_id_to_string(id);
        if (published_chunks_.insert(key).second) {
            claimed.push_back(std::move(key));
        }
        manifest.chunks.push_back(id);
        sizes.push_back(piece.size());
    }

    protocol::seal_manifest(manifest);
    resolver_.record(manifest);

    auto neighbours = router_.neighbours();
    neighbours.erase(std::remove(neighbours.begin(), neighbours.end(), self_id_), neighbours.end());
    if (config_.offer_fanout > 0 && neighbours.size() > config_.offer_fanout) {
        neighbours.resize(config_.offer_fanout);
    }

    std::size_t offers = 0;
    std::unordered_set<std::string> offered;
    for (std::size_t index = 0; index < manifest.chunks.size(); ++index) {
        const auto& id = manifest.chunks[index];
        if (!offered.insert(chunk_id_to_string(id)).second) {
            continue;
        }
        for (const auto& peer : neighbours) {
            ledger_.register_request(id, RequestKind::Offer, Subscriber::remote(peer), now);
            if (transport_.send_offer(id, peer, 0, static_cast<std::uint32_t>(sizes[index]))) {
                ++offers;
            }
        }
    }

    log::log_event(Level::Info,
                   "publish.complete",
                   {{"manifest", short_id(manifest.manifest_id)},
                    {"name", manifest.name},
                    {"chunks", std::to_string(manifest.chunks.size())},
                    {"bytes", std::to_string(manifest.total_size)},
                    {"offers", std::to_string(offers)}});
    return manifest;
}

std::optional<StatusSnapshot> ReplicationCoordinator::status(RequestHandle handle) const {
    std::scoped_lock lock(scheduler_mutex_);
    const auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return std::nullopt;
    }
    const auto& state = it->second;

    StatusSnapshot snapshot{};
    snapshot.handle = handle;
    snapshot.target = state.target;
    snapshot.is_manifest = state.manifest_id.has_value();
    snapshot.error = state.error;

    std::unordered_set<std::string> seen;
    for (const auto& id : state.chunks) {
        if (!seen.insert(chunk_id_to_string(id)).second) {
            continue;
        }
        ChunkProgress progress{};
        progress.id = id;
        progress.present = store_.has(id);
        if (const auto entry = ledger_.find(id, RequestKind::Fetch)) {
            progress.state = entry->state;
            progress.attempts = entry->attempts;
        }
        snapshot.chunks.push_back(progress);
    }

    snapshot.total_chunks = snapshot.chunks.size();
    snapshot.resolved_chunks = snapshot.total_chunks - std::min(snapshot.total_chunks, state.outstanding.size());
    if (state.error.has_value()) {
        snapshot.state = RequestState::Failed;
    } else if (state.outstanding.empty()) {
        snapshot.state = RequestState::Resolved;
    } else {
        snapshot.state = RequestState::Pending;
    }
    return snapshot;
}

StatusSnapshot ReplicationCoordinator::status_of(const ChunkId& id) const {
    std::scoped_lock lock(scheduler_mutex_);

    StatusSnapshot snapshot{};
    snapshot.target = id;
    snapshot.total_chunks = 1;

    ChunkProgress progress{};
    progress.id = id;
    progress.present = store_.has(id);
    const auto entry = ledger_.find(id, RequestKind::Fetch);
    if (entry.has_value()) {
        progress.state = entry->state;
        progress.attempts = entry->attempts;
    }
    snapshot.chunks.push_back(progress);

    if (progress.present) {
        snapshot.state = RequestState::Resolved;
        snapshot.resolved_chunks = 1;
    } else if (entry.has_value() && entry->state == RequestState::Pending) {
        snapshot.state = RequestState::Pending;
    } else if (entry.has_value() && entry->state == RequestState::Failed) {
        snapshot.state = RequestState::Failed;
        snapshot.error = ErrorCode::Failed;
    } else {
        snapshot.state = RequestState::Failed;
        snapshot.error = ErrorCode::NotFound;
    }
    return snapshot;
}

bool ReplicationCoordinator::cancel(RequestHandle handle) {
    std::scoped_lock lock(scheduler_mutex_);
    if (handle == interest_handle_) {
        return false;
    }
    const auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return false;
    }

    const auto torn_down = ledger_.cancel_subscriber(Subscriber::local(handle));
    handles_.erase(it);
    finished_handles_.erase(std::remove(finished_handles_.begin(), finished_handles_.end(), handle),
                            finished_handles_.end());

    log::log_event(Level::Info,
                   "fetch.cancelled",
                   {{"handle", std::to_string(handle)}, {"torn_down", std::to_string(torn_down.size())}});
    return true;
}

ReceiveOutcome ReplicationCoordinator::on_chunk_received(const ChunkId& id,
                                                         std::span<const std::uint8_t> payload,
                                                         const PeerId& from,
                                                         HopCount hop_distance,
                                                         std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);

    const auto entry = ledger_.find(id, RequestKind::Fetch);
    if (!entry.has_value() || entry->state != RequestState::Pending) {
        if (store_.has(id)) {
            return ReceiveOutcome::Duplicate;
        }
        return on_chunk_observed(id, payload, hop_distance, now);
    }

    if (crypto::identify(payload) != id) {
        log::log_event(Level::Warning,
                       "store.integrity",
                       {{"chunk", short_id(id)}, {"from", short_id(from)}});
        forget_source_locked(id, from);
        // Only the peer the current attempt went to can spend the retry budget.
        const bool from_current =
            entry->in_flight && entry->current_source.has_value() && *entry->current_source == from;
        if (!from_current) {
            return ReceiveOutcome::Rejected;
        }
        if (const auto outcome = ledger_.fail(id, RequestKind::Fetch, ErrorCode::Integrity, now)) {
            handle_failure_locked(*outcome);
        }
        return ReceiveOutcome::Rejected;
    }

    remember_source_locked(id, from);

    const bool keep = has_local_subscriber(entry->subscribers) || desired_chunks_.count(chunk_id_to_string(id)) > 0;
    auto outcome = ReceiveOutcome::Retained;
    if (!store_.has(id)) {
        outcome = admit_locked(id, payload, hop_distance, keep, entry->subscribers.size());
        if (outcome == ReceiveOutcome::Standby) {
            park_standby_locked(id, payload, hop_distance, entry->subscribers.size());
        }
    }

    const auto resolution = ledger_.resolve(id, RequestKind::Fetch, now);
    for (const auto& subscriber : resolution.subscribers) {
        if (subscriber.is_local()) {
            if (outcome == ReceiveOutcome::NotRetained) {
                fail_handle_locked(subscriber.handle, id, ErrorCode::Capacity);
            } else {
                resolve_handle_locked(subscriber.handle, id);
            }
            continue;
        }
        if (!transport_.send_chunk(id, payload, subscriber.peer, hop_distance)) {
            log::log_event(Level::Warning,
                           "relay.send_failed",
                           {{"chunk", short_id(id)}, {"peer", short_id(subscriber.peer)}});
        }
    }

    log::log_event(Level::Info,
                   "fetch.resolved",
                   {{"chunk", short_id(id)},
                    {"from", short_id(from)},
                    {"hops", std::to_string(hop_distance)},
                    {"subscribers", std::to_string(resolution.subscribers.size())},
                    {"waited_s", seconds_field(now - entry->requested_at)}});
    return outcome;
}

ReceiveOutcome ReplicationCoordinator::on_chunk_observed(const ChunkId& id,
                                                         std::span<const std::uint8_t> payload,
                                                         HopCount hop_distance,
                                                         std::chrono::steady_clock::time_point) {
    std::scoped_lock lock(scheduler_mutex_);
    if (store_.has(id)) {
        return ReceiveOutcome::Duplicate;
    }
    if (crypto::identify(payload) != id) {
        log::log_event(Level::Warning, "store.integrity", {{"chunk", short_id(id)}, {"source", "observed"}});
        return ReceiveOutcome::Rejected;
    }

    const bool keep = desired_chunks_.count(chunk_id_to_string(id)) > 0;
    const auto outcome = admit_locked(id, payload, hop_distance, keep, 0);
    if (outcome == ReceiveOutcome::Standby) {
        park_standby_locked(id, payload, hop_distance, 0);
    }
    return outcome;
}

void ReplicationCoordinator::on_offer_received(const ChunkId& id,
                                               const PeerId& from,
                                               HopCount hop_distance,
                                               std::uint32_t size,
                                               std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);
    if (store_.has(id)) {
        return;
    }
    remember_source_locked(id, from);

    if (const auto entry = ledger_.find(id, RequestKind::Fetch); entry && entry->state == RequestState::Pending) {
        ledger_.add_source(id, RequestKind::Fetch, from);
        if (!entry->in_flight) {
            dispatch_fetch_locked(id, now);
        }
        return;
    }

    if (!desired_locally_locked(id, size, hop_distance)) {
        log::log_event(Level::Debug, "offer.ignored", {{"chunk", short_id(id)}, {"from", short_id(from)}});
        return;
    }

    const auto outcome = ledger_.register_request(id, RequestKind::Fetch, Subscriber::local(interest_handle_), now);
    ledger_.add_source(id, RequestKind::Fetch, from);
    if (outcome.created) {
        log::log_event(Level::Info,
                       "offer.accepted",
                       {{"chunk", short_id(id)}, {"from", short_id(from)}, {"hops", std::to_string(hop_distance)}});
        dispatch_fetch_locked(id, now);
    }
}

void ReplicationCoordinator::on_chunk_request_from_peer(const ChunkId& id,
                                                        const PeerId& from,
                                                        std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);

    if (auto chunk = store_.get(id)) {
        const auto meta = store_.metadata(id);
        const auto hop = meta.has_value() ? meta->hop_distance : kUnknownHops;
        if (!transport_.send_chunk(id, chunk->payload, from, hop)) {
            log::log_event(Level::Warning, "serve.send_failed", {{"chunk", short_id(id)}, {"peer", short_id(from)}});
        }
        ledger_.resolve(id, RequestKind::Offer, now);
        log::log_event(Level::Debug, "serve.chunk", {{"chunk", short_id(id)}, {"peer", short_id(from)}});
        return;
    }

    if (!config_.relay_enabled) {
        reply_miss_locked(id, from);
        return;
    }

    const auto requester = Subscriber::remote(from);
    const auto outcome = ledger_.register_request(id, RequestKind::Fetch, requester, now);
    if (!outcome.created) {
        return;
    }

    seed_sources_locked(id);
    switch (send_to_next_source_locked(id, now)) {
        case DispatchResult::Sent:
            log::log_event(Level::Info, "relay.forward", {{"chunk", short_id(id)}, {"for", short_id(from)}});
            return;
        case DispatchResult::NoSource:
            ledger_.cancel(id, RequestKind::Fetch, requester);
            reply_miss_locked(id, from);
            log::log_event(Level::Debug, "relay.miss", {{"chunk", short_id(id)}, {"for", short_id(from)}});
            return;
        case DispatchResult::Refused:
            return;
    }
}

void ReplicationCoordinator::on_miss(const ChunkId& id, const PeerId& from, std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);
    forget_source_locked(id, from);

    const auto entry = ledger_.find(id, RequestKind::Fetch);
    if (!entry.has_value() || entry->state != RequestState::Pending || !entry->in_flight) {
        return;
    }
    if (entry->current_source.has_value() && *entry->current_source != from) {
        return;
    }
    if (const auto outcome = ledger_.fail(id, RequestKind::Fetch, ErrorCode::NotFound, now)) {
        handle_failure_locked(*outcome);
    }
}

void ReplicationCoordinator::on_send_failure(const ChunkId& id,
                                             const PeerId& peer,
                                             std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);
    log::log_event(Level::Warning, "transport.send_failed", {{"chunk", short_id(id)}, {"peer", short_id(peer)}});

    const auto entry = ledger_.find(id, RequestKind::Fetch);
    if (!entry.has_value() || entry->state != RequestState::Pending) {
        return;
    }
    if (entry->in_flight && entry->current_source.has_value() && *entry->current_source != peer) {
        return;
    }
    if (const auto outcome = ledger_.fail(id, RequestKind::Fetch, ErrorCode::Transport, now)) {
        handle_failure_locked(*outcome);
    }
}

void ReplicationCoordinator::subscribe(const protocol::FileManifest& manifest) {
    std::scoped_lock lock(scheduler_mutex_);
    resolver_.record(manifest);
    if (!subscribed_manifests_.insert(chunk_id_to_string(manifest.manifest_id)).second) {
        return;
    }
    std::unordered_set<std::string> seen;
    for (const auto& id : manifest.chunks) {
        auto key = chunk_id_to_string(id);
        if (seen.insert(key).second) {
            ++desired_chunks_[std::move(key)];
        }
    }
}

std::optional<ForgetReport> ReplicationCoordinator::forget_manifest(const ChunkId& manifest_id) {
    std::scoped_lock lock(scheduler_mutex_);
    const auto manifest = resolver_.find(manifest_id);
    if (!manifest.has_value() || !resolver_.remove(manifest_id)) {
        return std::nullopt;
    }
    const bool subscribed = subscribed_manifests_.erase(chunk_id_to_string(manifest_id)) > 0;

    std::unordered_set<std::string> referenced;
    for (const auto& other : resolver_.list()) {
        for (const auto& id : other.chunks) {
            referenced.insert(chunk_id_to_string(id));
        }
    }

    ForgetReport report{};
    std::unordered_set<std::string> seen;
    for (const auto& id : manifest->chunks) {
        auto key = chunk_id_to_string(id);
        if (!seen.insert(key).second) {
            continue;
        }
        if (subscribed) {
            if (const auto it = desired_chunks_.find(key); it != desired_chunks_.end() && --it->second == 0) {
                desired_chunks_.erase(it);
            }
        }
        if (referenced.count(key) > 0) {
            ++report.chunks_shared;
            continue;
        }
        published_chunks_.erase(key);

        const auto entry = ledger_.find(id, RequestKind::Fetch);
        if (entry.has_value() && entry->state == RequestState::Pending) {
            ++report.chunks_in_flight;
            continue;
        }
        if (store_.remove(id)) {
            ++report.chunks_removed;
        }
    }

    log::log_event(Level::Info,
                   "manifest.forgotten",
                   {{"manifest", short_id(manifest_id)},
                    {"removed", std::to_string(report.chunks_removed)},
                    {"shared", std::to_string(report.chunks_shared)},
                    {"in_flight", std::to_string(report.chunks_in_flight)}});
    return report;
}

bool ReplicationCoordinator::is_complete(const ChunkId& manifest_id) const {
    std::scoped_lock lock(scheduler_mutex_);
    const auto manifest = resolver_.find(manifest_id);
    if (!manifest.has_value()) {
        return false;
    }
    return std::all_of(manifest->chunks.begin(), manifest->chunks.end(), [&](const ChunkId& id) {
        return store_.has(id);
    });
}

bool ReplicationCoordinator::is_retained(const ChunkId& id) const {
    std::scoped_lock lock(scheduler_mutex_);
    return retained_locally_locked(id);
}

TickReport ReplicationCoordinator::tick(std::chrono::steady_clock::time_point now) {
    std::scoped_lock lock(scheduler_mutex_);
    TickReport report{};

    for (const auto& outcome : ledger_.expire(now)) {
        ++report.expired;
        if (outcome.terminal && outcome.kind == RequestKind::Fetch) {
            ++report.failed;
        }
        handle_failure_locked(outcome);
    }

    for (const auto& id : ledger_.due_for_retry(now)) {
        if (dispatch_fetch_locked(id, now)) {
            ++report.retried;
        }
    }

    report.swept = ledger_.sweep(now);
    report.handles_pruned = prune_handles_locked();
    report.sources_pruned = prune_sources_locked();

    if (standby_dirty_.exchange(false)) {
        report.standby_admitted = drain_standby_locked();
    }
    return report;
}

void ReplicationCoordinator::handle_offer(const ChunkId& id,
                                          const PeerId& from,
                                          HopCount hop_distance,
                                          std::uint32_t size) {
    on_offer_received(id, from, hop_distance, size, now());
}

void ReplicationCoordinator::handle_chunk(const ChunkId& id,
                                          std::span<const std::uint8_t> payload,
                                          const PeerId& from,
                                          HopCount hop_distance) {
    on_chunk_received(id, payload, from, hop_distance, now());
}

void ReplicationCoordinator::handle_request(const ChunkId& id, const PeerId& from) {
    on_chunk_request_from_peer(id, from, now());
}

void ReplicationCoordinator::handle_miss(const ChunkId& id, const PeerId& from) {
    on_miss(id, from, now());
}

void ReplicationCoordinator::seed_sources_locked(const ChunkId& id) {
    if (const auto it = known_sources_.find(chunk_id_to_string(id)); it != known_sources_.end()) {
        for (const auto& peer : it->second) {
            ledger_.add_source(id, RequestKind::Fetch, peer);
        }
    }

    auto candidates = router_.candidates_for(id);
    if (config_.fetch_source_fanout > 0 && candidates.size() > config_.fetch_source_fanout) {
        candidates.resize(config_.fetch_source_fanout);
    }
    for (const auto& peer : candidates) {
        if (peer != self_id_) {
            ledger_.add_source(id, RequestKind::Fetch, peer);
        }
    }
}

void ReplicationCoordinator::remember_source_locked(const ChunkId& id, const PeerId& peer) {
    if (peer == self_id_) {
        return;
    }
    auto& sources = known_sources_[chunk_id_to_string(id)];
    if (std::find(sources.begin(), sources.end(), peer) != sources.end()) {
        return;
    }
    if (sources.size() >= kKnownSourceLimit) {
        sources.erase(sources.begin());
    }
    sources.push_back(peer);
}

void ReplicationCoordinator::forget_source_locked(const ChunkId& id, const PeerId& peer) {
    const auto it = known_sources_.find(chunk_id_to_string(id));
    if (it == known_sources_.end()) {
        return;
    }
    auto& sources = it->second;
    sources.erase(std::remove(sources.begin(), sources.end(), peer), sources.end());
    if (sources.empty()) {
        known_sources_.erase(it);
    }
}

ReplicationCoordinator::DispatchResult ReplicationCoordinator::send_to_next_source_locked(
    const ChunkId& id,
    std::chrono::steady_clock::time_point now) {
    const auto source = ledger_.next_source(id, RequestKind::Fetch);
    if (!source.has_value()) {
        return DispatchResult::NoSource;
    }
    if (!transport_.send_request(id, *source)) {
        on_send_failure(id, *source, now);
        return DispatchResult::Refused;
    }
    ledger_.note_attempt(id, RequestKind::Fetch, *source, now);

    const auto entry = ledger_.find(id, RequestKind::Fetch);
    log::log_event(Level::Info,
                   "fetch.dispatch",
                   {{"chunk", short_id(id)},
                    {"peer", short_id(*source)},
                    {"attempt", std::to_string(entry.has_value() ? entry->attempts + 1 : 1)}});
    return DispatchResult::Sent;
}

bool ReplicationCoordinator::dispatch_fetch_locked(const ChunkId& id, std::chrono::steady_clock::time_point now) {
    seed_sources_locked(id);

    switch (send_to_next_source_locked(id, now)) {
        case DispatchResult::Sent:
            return true;
        case DispatchResult::Refused:
            return false;
        case DispatchResult::NoSource:
            break;
    }

    if (const auto outcome = ledger_.fail(id, RequestKind::Fetch, ErrorCode::NotFound, now)) {
        handle_failure_locked(*outcome);
    }
    return false;
}

void ReplicationCoordinator::handle_failure_locked(const FailureOutcome& outcome) {
    if (outcome.kind == RequestKind::Offer) {
        log::log_event(Level::Debug, "offer.expired", {{"chunk", short_id(outcome.id)}});
        return;
    }

    const auto reason = std::string(error_code_to_string(outcome.reason));
    if (!outcome.terminal) {
        log::log_event(Level::Info,
                       "fetch.retry",
                       {{"chunk", short_id(outcome.id)},
                        {"reason", reason},
                        {"attempts", std::to_string(outcome.attempts)}});
        return;
    }

    log::log_event(Level::Warning,
                   "fetch.failed",
                   {{"chunk", short_id(outcome.id)},
                    {"reason", reason},
                    {"attempts", std::to_string(outcome.attempts)}});

    for (const auto& subscriber : outcome.subscribers) {
        if (subscriber.is_local()) {
            fail_handle_locked(subscriber.handle, outcome.id, ErrorCode::Failed);
        } else {
            reply_miss_locked(outcome.id, subscriber.peer);
        }
    }
}

void ReplicationCoordinator::reply_miss_locked(const ChunkId& id, const PeerId& peer) {
    if (!transport_.send_miss(id, peer)) {
        log::log_event(Level::Warning, "relay.miss_send_failed", {{"chunk", short_id(id)}, {"peer", short_id(peer)}});
    }
}

bool ReplicationCoordinator::desired_locally_locked(const ChunkId& id,
                                                    std::uint32_t size,
                                                    HopCount hop_distance) const {
    if (desired_chunks_.count(chunk_id_to_string(id)) > 0) {
        return true;
    }
    return interest_filter_ && interest_filter_(id, size, hop_distance);
}

bool ReplicationCoordinator::retained_locally_locked(const ChunkId& id) const {
    const auto key = chunk_id_to_string(id);
    return published_chunks_.count(key) > 0 || desired_chunks_.count(key) > 0 || ledger_.is_pinned(id);
}

std::vector<ChunkId> ReplicationCoordinator::plan_evictions_locked(std::uint64_t bytes_to_free,
                                                                   const PinPredicate& pinned) const {
    std::vector<ChunkMetadata> window;
    for (std::size_t offset = 0;; offset += kEvictionScanPage) {
        auto page = store_.list_by_access_order(kEvictionScanPage, offset);
        if (page.empty()) {
            return {};
        }
        const bool last_page = page.size() < kEvictionScanPage;
        window.insert(window.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));

        auto victims = admission_.select_evictions(window, bytes_to_free, pinned);
        if (!victims.empty() || last_page) {
            return victims;
        }
    }
}

bool ReplicationCoordinator::make_room_locked(std::size_t size, const PinPredicate& pinned) {
    const auto capacity = store_.capacity_bytes();
    if (capacity == 0) {
        return true;
    }
    const auto used = store_.used_bytes();
    if (used + size <= capacity) {
        return true;
    }
    if (size > capacity) {
        return false;
    }

    const auto victims = plan_evictions_locked(used + size - capacity, pinned);
    if (victims.empty()) {
        return false;
    }
    for (const auto& victim : victims) {
        store_.remove(victim);
        log::log_event(Level::Info, "admission.evicted", {{"chunk", short_id(victim)}});
    }
    return true;
}

ReceiveOutcome ReplicationCoordinator::admit_locked(const ChunkId& id,
                                                    std::span<const std::uint8_t> payload,
                                                    HopCount hop_distance,
                                                    bool keep,
                                                    std::uint64_t demand) {
    const PinPredicate pinned = [this](const ChunkId& candidate) { return retained_locally_locked(candidate); };

    if (keep) {
        if (!make_room_locked(payload.size(), pinned)) {
            log::log_event(Level::Warning,
                           "admission.capacity",
                           {{"chunk", short_id(id)}, {"bytes", std::to_string(payload.size())}});
            return ReceiveOutcome::NotRetained;
        }
    } else {
        const auto wall = std::chrono::system_clock::now();
        // Scored over the least recently used window only.
        const auto least = admission_.least_valuable(store_.list_by_access_order(kEvictionScanPage), pinned, wall);

        AdmissionContext context{};
        context.used_bytes = store_.used_bytes();
        context.capacity_bytes = store_.capacity_bytes();
        if (least.has_value()) {
            context.least_valuable_score = least->score;
        }

        const ChunkMetadata candidate{id, payload.size(), wall, wall, hop_distance, demand};
        const auto decision = admission_.should_admit(candidate, context, wall);
        if (!decision.admit) {
            log::log_event(Level::Info,
                           "admission.declined",
                           {{"chunk", short_id(id)}, {"reason", decision.reason}});
            return ReceiveOutcome::Standby;
        }

        if (decision.bytes_to_free > 0) {
            const auto victims = plan_evictions_locked(decision.bytes_to_free, pinned);
            if (victims.empty()) {
                log::log_event(Level::Info,
                               "admission.declined",
                               {{"chunk", short_id(id)}, {"reason", "nothing evictable"}});
                return ReceiveOutcome::Standby;
            }
            for (const auto& victim : victims) {
                store_.remove(victim);
                log::log_event(Level::Info, "admission.evicted", {{"chunk", short_id(victim)}, {"for", short_id(id)}});
            }
        }
    }

    try {
        store_.put_verified(id, payload, hop_distance);
    } catch (const Error& error) {
        if (error.code() != ErrorCode::Capacity) {
            throw;
        }
        log::log_event(Level::Warning, "admission.capacity", {{"chunk", short_id(id)}, {"reason", error.message()}});
        return keep ? ReceiveOutcome::NotRetained : ReceiveOutcome::Standby;
    }
    return ReceiveOutcome::Retained;
}

void ReplicationCoordinator::park_standby_locked(const ChunkId& id,
                                                 std::span<const std::uint8_t> payload,
                                                 HopCount hop_distance,
                                                 std::uint64_t demand) {
    if (config_.standby_queue_limit == 0) {
        return;
    }
    const auto wall = std::chrono::system_clock::now();
    const auto score = admission_.score(ChunkMetadata{id, payload.size(), wall, wall, hop_distance, demand}, wall);
    const auto existing = std::find_if(standby_.begin(), standby_.end(), [&](const StandbyEntry& entry) {
        return entry.id == id;
    });
    if (existing != standby_.end()) {
        return;
    }

    StandbyEntry entry{id, ChunkData(payload.begin(), payload.end()), hop_distance, score};
    if (standby_.size() < config_.standby_queue_limit) {
        standby_.push_back(std::move(entry));
        return;
    }

    auto lowest = std::min_element(standby_.begin(), standby_.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.score < rhs.score;
    });
    if (lowest->score >= score) {
        log::log_event(Level::Debug, "standby.dropped", {{"chunk", short_id(id)}});
        return;
    }
    log::log_event(Level::Debug, "standby.dropped", {{"chunk", short_id(lowest->id)}});
    *lowest = std::move(entry);
}

std::size_t ReplicationCoordinator::drain_standby_locked() {
    std::sort(standby_.begin(), standby_.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.score > rhs.score;
    });

    std::size_t admitted = 0;
    for (auto it = standby_.begin(); it != standby_.end();) {
        if (store_.has(it->id)) {
            it = standby_.erase(it);
            continue;
        }
        const auto outcome = admit_locked(it->id, it->payload, it->hop_distance, false, 0);
        if (outcome == ReceiveOutcome::Retained) {
            log::log_event(Level::Info, "standby.admitted", {{"chunk", short_id(it->id)}});
            ++admitted;
            it = standby_.erase(it);
            continue;
        }
        ++it;
    }
    return admitted;
}

void ReplicationCoordinator::resolve_handle_locked(RequestHandle handle, const ChunkId& id) {
    if (listener_ != nullptr) {
        listener_->on_chunk_resolved(handle, id);
    }

    const auto it = handles_.find(handle);
    if (it == handles_.end()) {
        return;
    }
    auto& state = it->second;
    state.outstanding.erase(chunk_id_to_string(id));
    if (!state.outstanding.empty() || state.error.has_value() || state.complete_notified) {
        return;
    }

    state.complete_notified = true;
    mark_finished_locked(handle);
    log::log_event(Level::Info,
                   "fetch.complete",
                   {{"handle", std::to_string(handle)}, {"target", short_id(state.target)}});
    if (listener_ != nullptr && state.manifest_id.has_value()) {
        listener_->on_file_complete(handle, *state.manifest_id);
    }
}

void ReplicationCoordinator::fail_handle_locked(RequestHandle handle, const ChunkId& id, ErrorCode code) {
    const auto it = handles_.find(handle);
    if (it != handles_.end() && !it->second.error.has_value()) {
        it->second.error = code;
        if (!it->second.complete_notified) {
            mark_finished_locked(handle);
        }
    }
    if (listener_ != nullptr) {
        listener_->on_request_failed(handle, id, code);
    }
}

void ReplicationCoordinator::mark_finished_locked(RequestHandle handle) {
    finished_handles_.push_back(handle);
}

std::size_t ReplicationCoordinator::prune_handles_locked() {
    std::size_t pruned = 0;
    while (finished_handles_.size() > kRetainedFinishedHandles) {
        pruned += handles_.erase(finished_handles_.front());
        finished_handles_.pop_front();
    }
    return pruned;
}

std::size_t ReplicationCoordinator::prune_sources_locked() {
    const auto fetch_pending = [this](const ChunkId& id) {
        const auto entry = ledger_.find(id, RequestKind::Fetch);
        return entry.has_value() && entry->state == RequestState::Pending;
    };

    std::size_t pruned = 0;
    for (auto it = known_sources_.begin(); it != known_sources_.end();) {
        const auto id = chunk_id_from_string(it->first);
        if (!id.has_value() || (!fetch_pending(*id) && store_.has(*id))) {
            it = known_sources_.erase(it);
            ++pruned;
            continue;
        }
        ++it;
    }

    for (auto it = known_sources_.begin();
         it != known_sources_.end() && known_sources_.size() > kKnownSourceChunkLimit;) {
        if (!fetch_pending(*chunk_id_from_string(it->first))) {
            it = known_sources_.erase(it);
            ++pruned;
            continue;
        }
        ++it;
    }
    return pruned;
}

void ReplicationCoordinator::on_store_changed(const StoreChange& change) {
    if (change.kind == StoreChange::Kind::Removed) {
        standby_dirty_ = true;
    }
    std::scoped_lock lock(scheduler_mutex_);
    if (listener_ != nullptr) {
        listener_->on_store_changed(change);
    }
}

}  // namespace meshcache
