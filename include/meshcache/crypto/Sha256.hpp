#pragma once

#include "meshcache/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace meshcache::crypto {

class Sha256 {
public:
    using Digest = std::array<std::uint8_t, 32>;

    Sha256();

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);

private:
    void compress(const std::uint8_t* block);
    void reset();

    std::array<std::uint32_t, 8> state_{};
    std::array<std::uint8_t, 64> pending_{};
    std::size_t pending_size_{0};
    std::uint64_t total_bytes_{0};
};

// Content identity of a chunk payload.
ChunkId identify(std::span<const std::uint8_t> payload);

}  // namespace meshcache::crypto
