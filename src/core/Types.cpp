#include "meshcache/Types.hpp"

#include <iomanip>
#include <sstream>

namespace meshcache {

namespace {

std::string digest_to_hex(const std::array<std::uint8_t, 32>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (const auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    return -1;
}

std::optional<std::array<std::uint8_t, 32>> digest_from_hex(const std::string& text) {
    std::array<std::uint8_t, 32> bytes{};
    if (text.size() != bytes.size() * 2) {
        return std::nullopt;
    }

    for (std::size_t index = 0; index < bytes.size(); ++index) {
        const auto high = hex_value(text[index * 2]);
        const auto low = hex_value(text[index * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return bytes;
}

}  // namespace

std::string chunk_id_to_string(const ChunkId& id) {
    return digest_to_hex(id);
}

std::optional<ChunkId> chunk_id_from_string(const std::string& text) {
    return digest_from_hex(text);
}

std::string peer_id_to_string(const PeerId& id) {
    return digest_to_hex(id);
}

std::optional<PeerId> peer_id_from_string(const std::string& text) {
    return digest_from_hex(text);
}

std::string short_id(const ChunkId& id) {
    return chunk_id_to_string(id).substr(0, 12);
}

HopCount next_hop(HopCount hops) noexcept {
    if (hops >= kUnknownHops - 1) {
        return kUnknownHops;
    }
    return static_cast<HopCount>(hops + 1);
}

}  // namespace meshcache
