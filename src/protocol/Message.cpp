#include "meshcache/protocol/Message.hpp"

#include <cstring>
#include <type_traits>
#include <utility>

namespace meshcache::protocol {

namespace {

constexpr std::size_t kChunkIdSize = ChunkId{}.size();
constexpr std::size_t kHeaderSize = 2;

ChunkId parse_chunk_id(const std::uint8_t* data) {
    ChunkId id{};
    std::memcpy(id.data(), data, id.size());
    return id;
}

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

std::uint32_t read_u32(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

std::optional<Payload> decode_body(MessageType type, const std::uint8_t* data, std::size_t remaining) {
    switch (type) {
        case MessageType::Offer: {
            if (remaining != kChunkIdSize + 1 + 4) {
                return std::nullopt;
            }
            OfferPayload payload{};
            payload.chunk_id = parse_chunk_id(data);
            payload.hop_distance = data[kChunkIdSize];
            payload.size = read_u32(data + kChunkIdSize + 1);
            if (payload.size > kMaxChunkPayload) {
                return std::nullopt;
            }
            return Payload{payload};
        }
        case MessageType::Request: {
            if (remaining != kChunkIdSize) {
                return std::nullopt;
            }
            return Payload{RequestPayload{parse_chunk_id(data)}};
        }
        case MessageType::Chunk: {
            constexpr std::size_t fixed = kChunkIdSize + 1 + 4;
            if (remaining < fixed) {
                return std::nullopt;
            }
            const auto length = read_u32(data + kChunkIdSize + 1);
            if (length > kMaxChunkPayload || remaining != fixed + length) {
                return std::nullopt;
            }
            ChunkPayload payload{};
            payload.chunk_id = parse_chunk_id(data);
            payload.hop_distance = data[kChunkIdSize];
            payload.data.assign(data + fixed, data + fixed + length);
            return Payload{std::move(payload)};
        }
        case MessageType::Miss: {
            if (remaining != kChunkIdSize) {
                return std::nullopt;
            }
            return Payload{MissPayload{parse_chunk_id(data)}};
        }
    }
    return std::nullopt;
}

}  // namespace

Message make_offer(const ChunkId& id, HopCount hop_distance, std::uint32_t size) {
    return Message{kCurrentMessageVersion, MessageType::Offer, OfferPayload{id, hop_distance, size}};
}

Message make_request(const ChunkId& id) {
    return Message{kCurrentMessageVersion, MessageType::Request, RequestPayload{id}};
}

Message make_chunk(const ChunkId& id, std::span<const std::uint8_t> data, HopCount hop_distance) {
    ChunkPayload payload{};
    payload.chunk_id = id;
    payload.hop_distance = hop_distance;
    payload.data.assign(data.begin(), data.end());
    return Message{kCurrentMessageVersion, MessageType::Chunk, std::move(payload)};
}

Message make_miss(const ChunkId& id) {
    return Message{kCurrentMessageVersion, MessageType::Miss, MissPayload{id}};
}

std::vector<std::uint8_t> encode(const Message& message) {
    std::vector<std::uint8_t> out{};
    out.reserve(kHeaderSize + kChunkIdSize + 8);
    out.push_back(kCurrentMessageVersion);
    out.push_back(static_cast<std::uint8_t>(message.type));

    std::visit(
        [&](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;
            out.insert(out.end(), payload.chunk_id.begin(), payload.chunk_id.end());

            if constexpr (std::is_same_v<PayloadType, OfferPayload>) {
                out.push_back(payload.hop_distance);
                write_u32(out, payload.size);
            } else if constexpr (std::is_same_v<PayloadType, ChunkPayload>) {
                out.push_back(payload.hop_distance);
                write_u32(out, static_cast<std::uint32_t>(payload.data.size()));
                out.insert(out.end(), payload.data.begin(), payload.data.end());
            }
        },
        message.payload);

    return out;
}

std::optional<Message> decode(std::span<const std::uint8_t> buffer) {
    if (buffer.size() < kHeaderSize) {
        return std::nullopt;
    }

    const auto version = buffer[0];
    if (version != kCurrentMessageVersion) {
        return std::nullopt;
    }

    const auto type = static_cast<MessageType>(buffer[1]);
    auto payload = decode_body(type, buffer.data() + kHeaderSize, buffer.size() - kHeaderSize);
    if (!payload.has_value()) {
        return std::nullopt;
    }

    Message message{};
    message.version = version;
    message.type = type;
    message.payload = std::move(*payload);
    return message;
}

}  // namespace meshcache::protocol
