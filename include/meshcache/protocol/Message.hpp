#pragma once

#include "meshcache/Export.hpp"
#include "meshcache/Types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace meshcache::protocol {

inline constexpr std::uint8_t kCurrentMessageVersion = 1;
// Upper bound accepted for a chunk body on decode.
inline constexpr std::uint32_t kMaxChunkPayload = 1u << 20;

enum class MessageType : std::uint8_t {
    Offer = 0x01,
    Request = 0x02,
    Chunk = 0x03,
    Miss = 0x04,
};

struct OfferPayload {
    ChunkId chunk_id{};
    HopCount hop_distance{kUnknownHops};
    std::uint32_t size{0};
};

struct RequestPayload {
    ChunkId chunk_id{};
};

struct ChunkPayload {
    ChunkId chunk_id{};
    HopCount hop_distance{kUnknownHops};
    std::vector<std::uint8_t> data;
};

struct MissPayload {
    ChunkId chunk_id{};
};

using Payload = std::variant<OfferPayload, RequestPayload, ChunkPayload, MissPayload>;

struct Message {
    std::uint8_t version{kCurrentMessageVersion};
    MessageType type{MessageType::Offer};
    Payload payload{};
};

MESHCACHE_API Message make_offer(const ChunkId& id, HopCount hop_distance, std::uint32_t size);
MESHCACHE_API Message make_request(const ChunkId& id);
MESHCACHE_API Message make_chunk(const ChunkId& id, std::span<const std::uint8_t> data, HopCount hop_distance);
MESHCACHE_API Message make_miss(const ChunkId& id);

MESHCACHE_API std::vector<std::uint8_t> encode(const Message& message);
MESHCACHE_API std::optional<Message> decode(std::span<const std::uint8_t> buffer);

}  // namespace meshcache::protocol
