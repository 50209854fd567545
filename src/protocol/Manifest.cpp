#include "meshcache/protocol/Manifest.hpp"

#include "meshcache/Error.hpp"
#include "meshcache/crypto/Sha256.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <limits>

namespace meshcache::protocol {

namespace {

constexpr std::uint8_t kManifestVersion = 1;
constexpr char kScheme[] = "mesh://";
constexpr std::size_t kIdSize = ChunkId{}.size();

// URL-safe alphabet, no padding.
constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string base64url_encode(std::span<const std::uint8_t> input) {
    std::string output;
    output.reserve((input.size() * 4 + 2) / 3);

    std::uint32_t accumulator = 0;
    int bits = 0;
    for (const auto byte : input) {
        accumulator = (accumulator << 8) | byte;
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            output.push_back(kAlphabet[(accumulator >> bits) & 0x3Fu]);
        }
    }
    if (bits > 0) {
        output.push_back(kAlphabet[(accumulator << (6 - bits)) & 0x3Fu]);
    }
    return output;
}

std::vector<std::uint8_t> base64url_decode(std::string_view input) {
    std::array<int, 256> lookup{};
    lookup.fill(-1);
    for (int i = 0; i < 64; ++i) {
        lookup[static_cast<unsigned char>(kAlphabet[i])] = i;
    }

    std::vector<std::uint8_t> output;
    output.reserve(input.size() * 3 / 4);

    std::uint32_t accumulator = 0;
    int bits = 0;
    for (const auto ch : input) {
        const auto value = lookup[static_cast<unsigned char>(ch)];
        if (value < 0) {
            throw_error(ErrorCode::InvalidArgument, "manifest URI contains an invalid character");
        }
        accumulator = (accumulator << 6) | static_cast<std::uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            output.push_back(static_cast<std::uint8_t>((accumulator >> bits) & 0xFFu));
        }
    }
    return output;
}

void append_u16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value >> 8));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void append_u32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void append_u64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

// Bounds-checked cursor over an encoded manifest.
class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> buffer) : buffer_(buffer) {}

    std::uint8_t u8() {
        require(1);
        return buffer_[offset_++];
    }

    std::uint16_t u16() {
        require(2);
        const auto value = static_cast<std::uint16_t>((buffer_[offset_] << 8) | buffer_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    std::uint32_t u32() {
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | u8();
        }
        return value;
    }

    std::uint64_t u64() {
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | u8();
        }
        return value;
    }

    template <typename Array>
    Array fixed() {
        Array out{};
        require(out.size());
        std::memcpy(out.data(), buffer_.data() + offset_, out.size());
        offset_ += out.size();
        return out;
    }

    std::string text(std::size_t length) {
        require(length);
        std::string out(reinterpret_cast<const char*>(buffer_.data() + offset_), length);
        offset_ += length;
        return out;
    }

    std::size_t remaining() const noexcept {
        return buffer_.size() - offset_;
    }

private:
    void require(std::size_t count) const {
        if (buffer_.size() - offset_ < count) {
            throw_error(ErrorCode::InvalidArgument, "manifest truncated");
        }
    }

    std::span<const std::uint8_t> buffer_;
    std::size_t offset_{0};
};

}  // namespace

ChunkId compute_manifest_id(const std::vector<ChunkId>& chunks) {
    crypto::Sha256 hasher;
    for (const auto& id : chunks) {
        hasher.update(std::span<const std::uint8_t>(id.data(), id.size()));
    }
    return hasher.finalize();
}

void seal_manifest(FileManifest& manifest) {
    manifest.manifest_id = compute_manifest_id(manifest.chunks);
}

std::vector<std::span<const std::uint8_t>> split_payload(std::span<const std::uint8_t> payload,
                                                         std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw_error(ErrorCode::InvalidArgument, "chunk_size must be positive");
    }

    std::vector<std::span<const std::uint8_t>> pieces;
    pieces.reserve((payload.size() + chunk_size - 1) / chunk_size);
    for (std::size_t offset = 0; offset < payload.size(); offset += chunk_size) {
        pieces.push_back(payload.subspan(offset, std::min(chunk_size, payload.size() - offset)));
    }
    return pieces;
}

std::vector<std::uint8_t> encode_manifest(const FileManifest& manifest) {
    if (manifest.name.size() > std::numeric_limits<std::uint16_t>::max()) {
        throw_error(ErrorCode::InvalidArgument, "manifest name too long");
    }
    if (manifest.metadata.size() > std::numeric_limits<std::uint8_t>::max()) {
        throw_error(ErrorCode::InvalidArgument, "manifest metadata entry count exceeds limit");
    }
    if (manifest.chunks.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw_error(ErrorCode::InvalidArgument, "manifest chunk count exceeds limit");
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(1 + 2 * kIdSize + 24 + manifest.name.size() + manifest.chunks.size() * kIdSize);

    buffer.push_back(kManifestVersion);
    buffer.insert(buffer.end(), manifest.manifest_id.begin(), manifest.manifest_id.end());
    buffer.insert(buffer.end(), manifest.publisher.begin(), manifest.publisher.end());
    append_u64(buffer, manifest.total_size);
    append_u32(buffer, manifest.chunk_size);

    const auto created = std::chrono::duration_cast<std::chrono::seconds>(manifest.created_at.time_since_epoch()).count();
    append_u64(buffer, static_cast<std::uint64_t>(created));

    append_u16(buffer, static_cast<std::uint16_t>(manifest.name.size()));
    buffer.insert(buffer.end(), manifest.name.begin(), manifest.name.end());

    append_u32(buffer, static_cast<std::uint32_t>(manifest.chunks.size()));
    for (const auto& id : manifest.chunks) {
        buffer.insert(buffer.end(), id.begin(), id.end());
    }

    buffer.push_back(static_cast<std::uint8_t>(manifest.metadata.size()));
    for (const auto& [key, value] : manifest.metadata) {
        if (key.size() > std::numeric_limits<std::uint8_t>::max()) {
            throw_error(ErrorCode::InvalidArgument, "manifest metadata key too long");
        }
        if (value.size() > std::numeric_limits<std::uint16_t>::max()) {
            throw_error(ErrorCode::InvalidArgument, "manifest metadata value too long");
        }
        buffer.push_back(static_cast<std::uint8_t>(key.size()));
        buffer.insert(buffer.end(), key.begin(), key.end());
        append_u16(buffer, static_cast<std::uint16_t>(value.size()));
        buffer.insert(buffer.end(), value.begin(), value.end());
    }

    return buffer;
}

FileManifest decode_manifest(std::span<const std::uint8_t> buffer) {
    Reader reader(buffer);
    const auto version = reader.u8();
    if (version != kManifestVersion) {
        throw_error(ErrorCode::InvalidArgument, "unsupported manifest version " + std::to_string(version));
    }

    FileManifest manifest{};
    manifest.manifest_id = reader.fixed<ChunkId>();
    manifest.publisher = reader.fixed<PeerId>();
    manifest.total_size = reader.u64();
    manifest.chunk_size = reader.u32();
    manifest.created_at = std::chrono::system_clock::time_point(std::chrono::seconds(reader.u64()));

    const auto name_length = reader.u16();
    manifest.name = reader.text(name_length);

    const auto chunk_count = reader.u32();
    if (static_cast<std::uint64_t>(chunk_count) * kIdSize > reader.remaining()) {
        throw_error(ErrorCode::InvalidArgument, "manifest truncated");
    }
    manifest.chunks.reserve(chunk_count);
    for (std::uint32_t i = 0; i < chunk_count; ++i) {
        manifest.chunks.push_back(reader.fixed<ChunkId>());
    }

    const auto metadata_count = reader.u8();
    for (std::uint8_t i = 0; i < metadata_count; ++i) {
        const auto key_length = reader.u8();
        auto key = reader.text(key_length);
        const auto value_length = reader.u16();
        manifest.metadata.emplace(std::move(key), reader.text(value_length));
    }

    if (!manifest.chunks.empty()) {
        const auto chunk_size = static_cast<std::uint64_t>(manifest.chunk_size);
        const auto count = static_cast<std::uint64_t>(manifest.chunks.size());
        if (chunk_size == 0 || manifest.total_size > count * chunk_size ||
            manifest.total_size <= (count - 1) * chunk_size) {
            throw_error(ErrorCode::InvalidArgument, "manifest size does not match its chunk list");
        }
    } else if (manifest.total_size != 0) {
        throw_error(ErrorCode::InvalidArgument, "manifest size does not match its chunk list");
    }

    if (compute_manifest_id(manifest.chunks) != manifest.manifest_id) {
        throw_error(ErrorCode::Integrity,
                    "manifest identity does not match its chunk list",
                    "The manifest was altered in transit; request it again from its publisher");
    }

    return manifest;
}

std::string manifest_to_uri(const FileManifest& manifest) {
    const auto bytes = encode_manifest(manifest);
    return std::string{kScheme} + base64url_encode(bytes);
}

FileManifest manifest_from_uri(const std::string& uri) {
    if (!uri.starts_with(kScheme)) {
        throw_error(ErrorCode::InvalidArgument,
                    "manifest URI must start with mesh://",
                    "Pass the URI printed by 'meshcache publish'");
    }
    const auto bytes = base64url_decode(std::string_view(uri).substr(std::strlen(kScheme)));
    return decode_manifest(bytes);
}

}  // namespace meshcache::protocol
