#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace meshcache {

using ChunkId = std::array<std::uint8_t, 32>;
using PeerId = std::array<std::uint8_t, 32>;
using ChunkData = std::vector<std::uint8_t>;

// Hop distance to a chunk's publisher; kUnknownHops when nothing was advertised.
using HopCount = std::uint8_t;
inline constexpr HopCount kUnknownHops = 0xFF;

struct Chunk {
    ChunkId id{};
    ChunkData payload;
    std::size_t size{0};
    std::chrono::system_clock::time_point created_at{};
};

std::string chunk_id_to_string(const ChunkId& id);
std::optional<ChunkId> chunk_id_from_string(const std::string& text);
std::string peer_id_to_string(const PeerId& id);
std::optional<PeerId> peer_id_from_string(const std::string& text);

// Abbreviated form used in log fields.
std::string short_id(const ChunkId& id);

HopCount next_hop(HopCount hops) noexcept;

}  // namespace meshcache
