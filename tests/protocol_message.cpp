#include "meshcache/network/DatagramTransport.hpp"
#include "meshcache/protocol/Message.hpp"
#include "test_access.hpp"

#include <cassert>
#include <optional>
#include <variant>
#include <vector>

namespace {

struct RecordingHandler : meshcache::network::InboundHandler {
    std::size_t offers{0};
    std::size_t chunks{0};
    std::size_t requests{0};
    std::size_t misses{0};
    meshcache::HopCount last_hop{0};
    std::uint32_t last_size{0};

    void handle_offer(const meshcache::ChunkId&, const meshcache::PeerId&, meshcache::HopCount hop,
                      std::uint32_t size) override {
        ++offers;
        last_hop = hop;
        last_size = size;
    }
    void handle_chunk(const meshcache::ChunkId&, std::span<const std::uint8_t>, const meshcache::PeerId&,
                      meshcache::HopCount hop) override {
        ++chunks;
        last_hop = hop;
    }
    void handle_request(const meshcache::ChunkId&, const meshcache::PeerId&) override {
        ++requests;
    }
    void handle_miss(const meshcache::ChunkId&, const meshcache::PeerId&) override {
        ++misses;
    }
};

}  // namespace

int main() {
    meshcache::test::silence_logs();

    meshcache::ChunkId id{};
    id.fill(0xA5);
    const auto data = meshcache::test::make_payload(700, 0x03);

    {
        const auto bytes = meshcache::protocol::encode(meshcache::protocol::make_chunk(id, data, 4));
        assert(bytes.size() == 2 + 32 + 1 + 4 + data.size());
        assert(bytes[0] == meshcache::protocol::kCurrentMessageVersion);
        assert(bytes[1] == static_cast<std::uint8_t>(meshcache::protocol::MessageType::Chunk));

        const auto decoded = meshcache::protocol::decode(bytes);
        assert(decoded.has_value());
        const auto& chunk = std::get<meshcache::protocol::ChunkPayload>(decoded->payload);
        assert(chunk.chunk_id == id);
        assert(chunk.hop_distance == 4);
        assert(chunk.data == data);

        // Every strict prefix is rejected, as is a trailing byte.
        for (std::size_t length = 0; length < bytes.size(); length += 37) {
            const std::vector<std::uint8_t> prefix(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(length));
            assert(!meshcache::protocol::decode(prefix).has_value());
        }
        auto padded = bytes;
        padded.push_back(0x00);
        assert(!meshcache::protocol::decode(padded).has_value());
    }

    {
        const auto bytes = meshcache::protocol::encode(meshcache::protocol::make_offer(id, 2, 10'240));
        assert(bytes.size() == 2 + 32 + 1 + 4);
        const auto decoded = meshcache::protocol::decode(bytes);
        assert(decoded.has_value());
        const auto& offer = std::get<meshcache::protocol::OfferPayload>(decoded->payload);
        assert(offer.hop_distance == 2);
        assert(offer.size == 10'240);
    }

    {
        auto request = meshcache::protocol::encode(meshcache::protocol::make_request(id));
        assert(request.size() == 34);
        assert(meshcache::protocol::decode(request).has_value());

        auto unknown_type = request;
        unknown_type[1] = 0x09;
        assert(!meshcache::protocol::decode(unknown_type).has_value());

        auto future_version = request;
        future_version[0] = meshcache::protocol::kCurrentMessageVersion + 1;
        assert(!meshcache::protocol::decode(future_version).has_value());
    }

    // A chunk header announcing more than the accepted maximum.
    {
        auto bytes = meshcache::protocol::encode(meshcache::protocol::make_chunk(id, data, 1));
        bytes[35] = 0x7F;
        assert(!meshcache::protocol::decode(bytes).has_value());
    }

    // The transport hands decoded messages to its handler one hop further away.
    std::vector<std::vector<std::uint8_t>> sent;
    meshcache::network::DatagramTransport transport(
        [&](const meshcache::PeerId&, std::span<const std::uint8_t> bytes) {
            sent.emplace_back(bytes.begin(), bytes.end());
            return true;
        });
    RecordingHandler handler;
    transport.set_handler(&handler);

    const auto peer = meshcache::test::make_peer_id(0x09);
    assert(transport.send_offer(id, peer, 0, 512));
    assert(transport.send_chunk(id, data, peer, meshcache::kUnknownHops));
    assert(transport.send_request(id, peer));
    assert(transport.send_miss(id, peer));
    assert(sent.size() == 4);

    assert(transport.deliver(peer, sent[0]));
    assert(handler.offers == 1);
    assert(handler.last_hop == 1);
    assert(handler.last_size == 512);

    assert(transport.deliver(peer, sent[1]));
    assert(handler.chunks == 1);
    assert(handler.last_hop == meshcache::kUnknownHops);

    assert(transport.deliver(peer, sent[2]));
    assert(transport.deliver(peer, sent[3]));
    assert(handler.requests == 1);
    assert(handler.misses == 1);

    const std::vector<std::uint8_t> garbage{0x01};
    assert(!transport.deliver(peer, garbage));
    return 0;
}
