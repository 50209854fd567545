#include "meshcache/core/RequestLedger.hpp"
#include "test_access.hpp"

#include <cassert>
#include <chrono>

using namespace std::chrono_literals;

namespace {

meshcache::ChunkId chunk(std::uint8_t fill) {
    meshcache::ChunkId id{};
    id.fill(fill);
    return id;
}

void deduplicates_and_fans_out() {
    meshcache::RequestLedger ledger{};
    const auto t0 = std::chrono::steady_clock::time_point{} + 1000s;
    const auto id = chunk(0x01);
    const auto remote = meshcache::test::make_peer_id(0x50);

    const auto first = ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(7), t0);
    assert(first.created);
    const auto second = ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(8), t0);
    assert(!second.created);
    const auto again = ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(7), t0);
    assert(!again.created);
    ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::remote(remote), t0);

    // Offer entries for the same identity are tracked separately.
    assert(ledger.register_request(id, meshcache::RequestKind::Offer, meshcache::Subscriber::remote(remote), t0)
               .created);
    assert(ledger.pending_count(meshcache::RequestKind::Fetch) == 1);
    assert(ledger.pending_count(meshcache::RequestKind::Offer) == 1);
    assert(ledger.is_pinned(id));

    const auto resolution = ledger.resolve(id, meshcache::RequestKind::Fetch, t0 + 1s);
    assert(resolution.resolved);
    assert(resolution.subscribers.size() == 3);
    assert(!ledger.resolve(id, meshcache::RequestKind::Fetch, t0 + 2s).resolved);
    assert(ledger.find(id, meshcache::RequestKind::Fetch)->state == meshcache::RequestState::Resolved);
}

void backoff_grows_and_caps() {
    meshcache::Config config{};
    config.fetch_retry_initial_backoff = 3s;
    config.fetch_retry_max_backoff = 20s;
    config.fetch_retry_attempt_limit = 4;
    meshcache::RequestLedger ledger(config);

    assert(ledger.backoff_for(1) == 3s);
    assert(ledger.backoff_for(2) == 6s);
    assert(ledger.backoff_for(3) == 12s);
    assert(ledger.backoff_for(4) == 20s);
    assert(ledger.backoff_for(40) == 20s);

    const auto t0 = std::chrono::steady_clock::time_point{} + 500s;
    const auto id = chunk(0x02);
    ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(1), t0);
    assert(ledger.note_attempt(id, meshcache::RequestKind::Fetch, meshcache::test::make_peer_id(1), t0));
    assert(ledger.due_for_retry(t0 + 100s).empty());

    auto outcome = ledger.fail(id, meshcache::RequestKind::Fetch, meshcache::ErrorCode::NotFound, t0);
    assert(outcome.has_value());
    assert(!outcome->terminal);
    assert(outcome->attempts == 1);
    assert(outcome->next_attempt_at == t0 + 3s);
    assert(ledger.due_for_retry(t0 + 2s).empty());
    assert(ledger.due_for_retry(t0 + 3s).size() == 1);

    ledger.fail(id, meshcache::RequestKind::Fetch, meshcache::ErrorCode::Timeout, t0);
    ledger.fail(id, meshcache::RequestKind::Fetch, meshcache::ErrorCode::Timeout, t0);
    outcome = ledger.fail(id, meshcache::RequestKind::Fetch, meshcache::ErrorCode::Timeout, t0 + 1s);
    assert(outcome.has_value());
    assert(outcome->terminal);
    assert(outcome->attempts == 4);
    assert(outcome->subscribers.size() == 1);
    assert(!ledger.fail(id, meshcache::RequestKind::Fetch, meshcache::ErrorCode::Timeout, t0 + 2s).has_value());
    assert(ledger.find(id, meshcache::RequestKind::Fetch)->state == meshcache::RequestState::Failed);
    assert(!ledger.is_pinned(id));
}

void expiry_and_grace() {
    meshcache::Config config{};
    config.request_timeout = 10s;
    config.offer_ttl = 60s;
    config.ledger_resolved_grace = 20s;
    meshcache::RequestLedger ledger(config);

    const auto t0 = std::chrono::steady_clock::time_point{} + 2000s;
    const auto fetch_id = chunk(0x03);
    const auto offer_id = chunk(0x04);
    const auto peer = meshcache::test::make_peer_id(0x20);

    ledger.register_request(fetch_id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(1), t0);
    ledger.register_request(offer_id, meshcache::RequestKind::Offer, meshcache::Subscriber::remote(peer), t0);

    // Nothing in flight, so the fetch entry cannot time out yet.
    assert(ledger.expire(t0 + 30s).empty());

    ledger.note_attempt(fetch_id, meshcache::RequestKind::Fetch, peer, t0 + 30s);
    assert(ledger.expire(t0 + 39s).empty());
    const auto expired = ledger.expire(t0 + 40s);
    assert(expired.size() == 1);
    assert(expired.front().reason == meshcache::ErrorCode::Timeout);
    assert(!expired.front().terminal);

    const auto offers = ledger.expire(t0 + 60s);
    assert(offers.size() == 1);
    assert(offers.front().kind == meshcache::RequestKind::Offer);
    assert(offers.front().terminal);

    // Terminal entries stay visible for the grace period, then vanish.
    assert(ledger.sweep(t0 + 79s) == 0);
    assert(ledger.find(offer_id, meshcache::RequestKind::Offer).has_value());
    assert(ledger.sweep(t0 + 80s) == 1);
    assert(!ledger.find(offer_id, meshcache::RequestKind::Offer).has_value());
    assert(ledger.find(fetch_id, meshcache::RequestKind::Fetch).has_value());

    // Reopening within the grace window keeps the providers already learned.
    const auto resolved_id = chunk(0x05);
    ledger.register_request(resolved_id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(2), t0);
    ledger.add_source(resolved_id, meshcache::RequestKind::Fetch, peer);
    ledger.resolve(resolved_id, meshcache::RequestKind::Fetch, t0 + 1s);
    const auto reopened =
        ledger.register_request(resolved_id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(3), t0 + 5s);
    assert(reopened.created);
    assert(reopened.entry.sources.size() == 1);
    assert(reopened.entry.attempts == 0);
}

void cancel_and_source_rotation() {
    meshcache::RequestLedger ledger{};
    const auto t0 = std::chrono::steady_clock::time_point{} + 10s;
    const auto id = chunk(0x06);
    const auto a = meshcache::test::make_peer_id(0x10);
    const auto b = meshcache::test::make_peer_id(0x20);
    const auto requester = meshcache::test::make_peer_id(0x30);

    ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(4), t0);
    ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::remote(requester), t0);
    assert(ledger.add_source(id, meshcache::RequestKind::Fetch, a));
    assert(!ledger.add_source(id, meshcache::RequestKind::Fetch, a));
    assert(ledger.add_source(id, meshcache::RequestKind::Fetch, requester));
    assert(ledger.add_source(id, meshcache::RequestKind::Fetch, b));

    // The waiting requester is never asked for its own chunk.
    assert(*ledger.next_source(id, meshcache::RequestKind::Fetch) == a);
    assert(*ledger.next_source(id, meshcache::RequestKind::Fetch) == b);
    assert(*ledger.next_source(id, meshcache::RequestKind::Fetch) == a);

    assert(!ledger.cancel(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(4)));
    assert(ledger.find(id, meshcache::RequestKind::Fetch).has_value());
    assert(ledger.cancel(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::remote(requester)));
    assert(!ledger.find(id, meshcache::RequestKind::Fetch).has_value());

    const auto other = chunk(0x07);
    ledger.register_request(other, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(9), t0);
    ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(9), t0);
    ledger.register_request(id, meshcache::RequestKind::Fetch, meshcache::Subscriber::local(10), t0);
    const auto torn_down = ledger.cancel_subscriber(meshcache::Subscriber::local(9));
    assert(torn_down.size() == 1);
    assert(torn_down.front().first == other);
    assert(ledger.find(id, meshcache::RequestKind::Fetch)->subscribers.size() == 1);
}

}  // namespace

int main() {
    meshcache::test::silence_logs();

    deduplicates_and_fans_out();
    backoff_grows_and_caps();
    expiry_and_grace();
    cancel_and_source_rotation();
    return 0;
}
