#include "meshcache/network/DatagramTransport.hpp"

#include "meshcache/log/StructuredLogger.hpp"

#include <type_traits>
#include <utility>
#include <variant>

namespace meshcache::network {

DatagramTransport::DatagramTransport(DatagramSink sink)
    : sink_(std::move(sink)) {}

void DatagramTransport::set_handler(InboundHandler* handler) {
    std::scoped_lock lock(handler_mutex_);
    handler_ = handler;
}

bool DatagramTransport::send_request(const ChunkId& id, const PeerId& to) {
    return send(to, protocol::make_request(id));
}

bool DatagramTransport::send_chunk(const ChunkId& id,
                                   std::span<const std::uint8_t> payload,
                                   const PeerId& to,
                                   HopCount hop_distance) {
    if (payload.size() > protocol::kMaxChunkPayload) {
        return false;
    }
    return send(to, protocol::make_chunk(id, payload, hop_distance));
}

bool DatagramTransport::send_offer(const ChunkId& id, const PeerId& to, HopCount hop_distance, std::uint32_t size) {
    return send(to, protocol::make_offer(id, hop_distance, size));
}

bool DatagramTransport::send_miss(const ChunkId& id, const PeerId& to) {
    return send(to, protocol::make_miss(id));
}

bool DatagramTransport::send(const PeerId& to, const protocol::Message& message) {
    if (!sink_) {
        return false;
    }
    const auto datagram = protocol::encode(message);
    return sink_(to, datagram);
}

bool DatagramTransport::deliver(const PeerId& from, std::span<const std::uint8_t> datagram) {
    const auto message = protocol::decode(datagram);
    if (!message.has_value()) {
        log::log_event(log::StructuredLogger::Level::Warning,
                       "wire.malformed",
                       {{"from", short_id(from)},
                        {"bytes", std::to_string(datagram.size())}});
        return false;
    }

    InboundHandler* handler = nullptr;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = handler_;
    }
    if (handler == nullptr) {
        return true;
    }

    std::visit(
        [&](const auto& payload) {
            using PayloadType = std::decay_t<decltype(payload)>;
            if constexpr (std::is_same_v<PayloadType, protocol::OfferPayload>) {
                handler->handle_offer(payload.chunk_id, from, next_hop(payload.hop_distance), payload.size);
            } else if constexpr (std::is_same_v<PayloadType, protocol::RequestPayload>) {
                handler->handle_request(payload.chunk_id, from);
            } else if constexpr (std::is_same_v<PayloadType, protocol::ChunkPayload>) {
                handler->handle_chunk(payload.chunk_id, payload.data, from, next_hop(payload.hop_distance));
            } else if constexpr (std::is_same_v<PayloadType, protocol::MissPayload>) {
                handler->handle_miss(payload.chunk_id, from);
            }
        },
        message->payload);
    return true;
}

}  // namespace meshcache::network
